#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <memory>
#include <string>
#include "library.hpp"
#include "transfer.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

struct HttpSettings {
    fs::path static_dir;
    TransferOptions transfer;
    // Deadline for receiving one request; responses are not limited.
    std::chrono::steady_clock::duration read_timeout = std::chrono::seconds(30);
};

// Plain HTTP on the streaming port: file listings, direct audio, static
// files. A WebSocket upgrade request hands the socket to a StreamSession.
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket&& socket, int id, const AudioLibrary& library, const HttpSettings& settings);

    void run();

private:
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void handle_request();
    void on_write(bool close, beast::error_code ec);
    void do_close();

    template <class Body>
    void send(http::response<Body>&& res);

    http::response<http::string_body> text_response(http::status status, const std::string& content_type, std::string body) const;
    void send_file(const fs::path& path);

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    const int id_;
    const AudioLibrary& library_;
    const HttpSettings& settings_;
};

// MIME type from a file extension, application/octet-stream when unknown.
std::string mimeType(const std::string& path);
