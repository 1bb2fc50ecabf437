#include "headers/client.hpp"
#include "headers/protocol.hpp"
#include <iostream>

StreamClient::StreamClient(const std::string& host, const std::string& port, const std::string& target)
    : resolver_(io_context_), ws_(io_context_) {
    auto const results = resolver_.resolve(host, port);
    boost::asio::connect(ws_.next_layer(), results.begin(), results.end());

    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(boost::beast::http::field::user_agent, "AudioStreamClient");
        }));

    ws_.handshake(host + ":" + port, target);
}

StreamClient::~StreamClient() {
    try {
        close();
    }
    catch (const std::exception& e) {
        std::cerr << "Error closing WebSocket: " << e.what() << std::endl;
    }
}

void StreamClient::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    boost::system::error_code ec;
    if (ws_.is_open()) {
        ws_.close(websocket::close_code::normal, ec);
    }
    // A closed or reset peer is already gone; nothing left to report.
    if (ec && ec != websocket::error::closed && ec != boost::asio::error::eof) {
        throw boost::system::system_error(ec);
    }
}

void StreamClient::start(const std::string& filename) {
    protocol::ControlMessage message;
    message.action = protocol::Action::Start;
    message.filename = filename;
    sendText(protocol::encodeControlMessage(message));
}

void StreamClient::stop() {
    protocol::ControlMessage message;
    message.action = protocol::Action::Stop;
    sendText(protocol::encodeControlMessage(message));
}

void StreamClient::sendText(const std::string& text) {
    ws_.text(true);
    ws_.write(boost::asio::buffer(text));
}

Frame StreamClient::read() {
    buffer_.consume(buffer_.size());
    ws_.read(buffer_);

    Frame frame;
    frame.binary = ws_.got_binary();
    frame.data = boost::beast::buffers_to_string(buffer_.data());
    return frame;
}

FetchResult StreamClient::fetch(const std::string& filename, std::ostream& out,
    const std::function<void(const std::string&)>& on_status) {
    start(filename);

    FetchResult result;
    for (;;) {
        Frame frame = read();
        if (frame.binary) {
            out.write(frame.data.data(), static_cast<std::streamsize>(frame.data.size()));
            result.chunks++;
            result.bytes += frame.data.size();
            continue;
        }

        std::string status;
        if (!protocol::decodeStatus(frame.data, status)) {
            std::cerr << "[Info] " << frame.data << std::endl;
            continue;
        }
        if (on_status) {
            on_status(status);
        }
        if (protocol::status::isTerminal(status)) {
            result.final_status = status;
            return result;
        }
    }
}
