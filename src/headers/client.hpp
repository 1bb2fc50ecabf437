#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

using tcp = boost::asio::ip::tcp;
namespace websocket = boost::beast::websocket;

struct Frame {
    bool binary = false;
    std::string data;
};

struct FetchResult {
    std::string final_status;
    std::uint64_t chunks = 0;
    std::uint64_t bytes = 0;
};

// Blocking WebSocket client for the streaming protocol. Every call throws
// boost::system::system_error on transport failure.
class StreamClient {
public:
    StreamClient(const std::string& host, const std::string& port, const std::string& target = "/ws");
    ~StreamClient();

    void start(const std::string& filename);
    void stop();
    void sendText(const std::string& text);

    Frame read();

    // Starts filename and copies binary frames to out until a terminal
    // status (finished, stopped, error) arrives.
    FetchResult fetch(const std::string& filename, std::ostream& out,
        const std::function<void(const std::string&)>& on_status = nullptr);

    void close();

private:
    boost::asio::io_context io_context_;
    tcp::resolver resolver_;
    websocket::stream<tcp::socket> ws_;
    boost::beast::flat_buffer buffer_;
    bool closed_ = false;
};
