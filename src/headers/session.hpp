#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include "cancel_token.hpp"
#include "library.hpp"
#include "transfer.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

// One WebSocket connection. Reads control messages, starts and cancels
// transfers, and serializes every outbound frame through one write queue.
class StreamSession : public TransferSink, public std::enable_shared_from_this<StreamSession> {
public:
    StreamSession(tcp::socket&& socket, int id, const AudioLibrary& library, TransferOptions options);
    ~StreamSession() override;

    // Completes the WebSocket handshake for an upgrade request already read.
    void run(http::request<http::string_body> req);

    void send_status(const std::string& text) override;
    void send_chunk(std::string chunk, SendHandler handler) override;
    void transfer_ended(const CancelTokenPtr& token) override;

private:
    struct OutboundFrame {
        bool binary = false;
        std::string payload;
        SendHandler on_sent;
    };

    void on_accept(beast::error_code ec);
    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void handle_message(const std::string& text);
    void handle_start(const std::string& filename);
    void handle_stop();
    void teardown();

    void queue_frame(OutboundFrame frame);
    void write_next();
    void on_write(beast::error_code ec);

    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    const int id_;
    const AudioLibrary& library_;
    const TransferOptions options_;

    std::mutex state_mutex_;
    bool streaming_ = false;
    CancelTokenPtr cancel_;

    std::mutex send_mutex_;
    std::queue<OutboundFrame> outbound_;
    bool closed_ = false;
};
