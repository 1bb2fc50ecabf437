#include "headers/session.hpp"
#include "headers/protocol.hpp"
#include <iostream>
#include <vector>

StreamSession::StreamSession(tcp::socket&& socket, int id, const AudioLibrary& library, TransferOptions options)
    : ws_(std::move(socket)),
      id_(id),
      library_(library),
      options_(options),
      cancel_(std::make_shared<CancelToken>()) {
}

StreamSession::~StreamSession() {
    std::cout << "[session " << id_ << "] closed" << std::endl;
}

void StreamSession::run(http::request<http::string_body> req) {
    // Set WebSocket options for better stability
    ws_.set_option(websocket::stream_base::timeout::suggested(
        beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, "AudioStreamServer");
        }));
    // Control messages are tiny JSON objects.
    ws_.read_message_max(64 * 1024);

    auto self = shared_from_this();
    ws_.async_accept(req, [self](beast::error_code ec) {
        self->on_accept(ec);
        });
}

void StreamSession::on_accept(beast::error_code ec) {
    if (ec) {
        std::cerr << "[session " << id_ << "] WebSocket handshake failed: " << ec.message() << std::endl;
        teardown();
        return;
    }

    beast::error_code endpoint_ec;
    std::cout << "[session " << id_ << "] WebSocket connection established from "
              << beast::get_lowest_layer(ws_).socket().remote_endpoint(endpoint_ec) << std::endl;
    do_read();
}

void StreamSession::do_read() {
    auto self = shared_from_this();
    ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t bytes_transferred) {
        self->on_read(ec, bytes_transferred);
        });
}

void StreamSession::on_read(beast::error_code ec, std::size_t bytes_transferred) {
    if (ec == websocket::error::closed) {
        std::cout << "[session " << id_ << "] Client disconnected gracefully." << std::endl;
        teardown();
        return;
    }
    if (ec) {
        std::cerr << "[session " << id_ << "] Error reading message: " << ec.message() << std::endl;
        teardown();
        return;
    }

    if (!ws_.got_text()) {
        std::cerr << "[session " << id_ << "] Ignoring binary frame of " << bytes_transferred << " bytes" << std::endl;
    }
    else {
        handle_message(beast::buffers_to_string(buffer_.data()));
    }
    buffer_.consume(buffer_.size());

    do_read();
}

void StreamSession::handle_message(const std::string& text) {
    protocol::ControlMessage message;
    try {
        message = protocol::parseControlMessage(text);
    }
    catch (const protocol::ProtocolError& e) {
        std::cerr << "[session " << id_ << "] Error unmarshaling message: " << e.what() << std::endl;
        return;
    }

    switch (message.action) {
    case protocol::Action::Start:
        handle_start(message.filename);
        break;
    case protocol::Action::Stop:
        handle_stop();
        break;
    case protocol::Action::Unknown:
        std::cerr << "[session " << id_ << "] Unknown action in message: " << text << std::endl;
        break;
    }
}

void StreamSession::handle_start(const std::string& filename) {
    if (filename.empty()) {
        send_status(protocol::status::kNoFilename);
        return;
    }

    CancelTokenPtr token;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (streaming_) {
            std::cout << "[session " << id_ << "] Superseding current stream with " << filename << std::endl;
        }
        // Firing an idle token is harmless; supersede and stop share this path.
        cancel_->fire();
        cancel_ = std::make_shared<CancelToken>();
        token = cancel_;
        streaming_ = true;
    }

    auto worker = std::make_shared<TransferWorker>(
        ws_.get_executor(), shared_from_this(), id_, library_, options_, filename, token);
    worker->start();
}

void StreamSession::handle_stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!streaming_) {
            return;
        }
        cancel_->fire();
        cancel_ = std::make_shared<CancelToken>();
        streaming_ = false;
    }

    std::cout << "[session " << id_ << "] Streaming stopped by client" << std::endl;
    send_status(protocol::status::kStopped);
}

void StreamSession::transfer_ended(const CancelTokenPtr& token) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    // A superseded worker must not clear the flag of its successor.
    if (token == cancel_) {
        streaming_ = false;
    }
}

void StreamSession::teardown() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        cancel_->fire();
        streaming_ = false;
    }
    std::lock_guard<std::mutex> lock(send_mutex_);
    closed_ = true;
}

void StreamSession::send_status(const std::string& text) {
    OutboundFrame frame;
    frame.binary = false;
    frame.payload = protocol::encodeStatus(text);
    queue_frame(std::move(frame));
}

void StreamSession::send_chunk(std::string chunk, SendHandler handler) {
    OutboundFrame frame;
    frame.binary = true;
    frame.payload = std::move(chunk);
    frame.on_sent = std::move(handler);
    queue_frame(std::move(frame));
}

void StreamSession::queue_frame(OutboundFrame frame) {
    bool start_writing = false;
    SendHandler rejected;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (closed_) {
            rejected = std::move(frame.on_sent);
        }
        else {
            start_writing = outbound_.empty();
            outbound_.push(std::move(frame));
        }
    }

    auto self = shared_from_this();
    if (rejected) {
        net::post(ws_.get_executor(), [rejected]() {
            rejected(net::error::not_connected);
            });
        return;
    }

    if (start_writing) {
        // Post to the session strand to keep writes off the caller's stack
        net::post(ws_.get_executor(), [self]() {
            self->write_next();
            });
    }
}

void StreamSession::write_next() {
    OutboundFrame* frame = nullptr;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        if (outbound_.empty()) {
            return;
        }
        // The front stays queued until its write completes.
        frame = &outbound_.front();
    }

    ws_.binary(frame->binary);

    auto self = shared_from_this();
    ws_.async_write(net::buffer(frame->payload),
        [self](beast::error_code ec, std::size_t) {
            self->on_write(ec);
        });
}

void StreamSession::on_write(beast::error_code ec) {
    SendHandler handler;
    std::vector<SendHandler> failed;
    bool has_more = false;
    {
        std::lock_guard<std::mutex> lock(send_mutex_);
        handler = std::move(outbound_.front().on_sent);
        outbound_.pop();

        if (ec) {
            closed_ = true;
            while (!outbound_.empty()) {
                if (outbound_.front().on_sent) {
                    failed.push_back(std::move(outbound_.front().on_sent));
                }
                outbound_.pop();
            }
        }
        else {
            has_more = !outbound_.empty();
        }
    }

    if (ec && ec != websocket::error::closed) {
        std::cerr << "[session " << id_ << "] Failed to send message to client: " << ec.message() << std::endl;
    }

    if (handler) {
        handler(ec);
    }
    for (auto& h : failed) {
        h(ec);
    }

    if (has_more) {
        write_next();
    }
}
