#include "headers/transfer.hpp"
#include "headers/protocol.hpp"
#include <iostream>

TransferWorker::TransferWorker(boost::asio::any_io_executor executor,
    std::shared_ptr<TransferSink> sink,
    int session_id,
    const AudioLibrary& library,
    TransferOptions options,
    std::string filename,
    CancelTokenPtr token)
    : timer_(executor),
      sink_(std::move(sink)),
      session_id_(session_id),
      library_(library),
      options_(options),
      filename_(std::move(filename)),
      token_(std::move(token)) {
}

void TransferWorker::start() {
    auto path = library_.resolve(filename_);
    if (!path) {
        std::cerr << "[session " << session_id_ << "] File not found: " << filename_ << std::endl;
        sink_->send_status(protocol::status::fileNotFound(filename_));
        sink_->transfer_ended(token_);
        return;
    }

    sink_->send_status(protocol::status::streaming(filename_));

    reader_ = library_.open(*path);
    if (!reader_->isOpen()) {
        std::cerr << "[session " << session_id_ << "] Error opening file: " << path->string() << std::endl;
        finish(protocol::status::kOpenError);
        return;
    }

    std::cout << "[session " << session_id_ << "] Streaming file: " << filename_ << " (size: " << reader_->size() << " bytes)" << std::endl;
    started_ = std::chrono::steady_clock::now();
    next_chunk();
}

void TransferWorker::next_chunk() {
    if (token_->fired()) {
        std::cout << "[session " << session_id_ << "] Streaming stopped for file: " << filename_
                  << " after " << chunks_sent_ << " chunks" << std::endl;
        return;
    }

    std::string chunk;
    switch (reader_->readChunk(chunk, options_.chunk_size)) {
    case ReadStatus::End:
        std::cout << "[session " << session_id_ << "] Finished streaming file: " << filename_ << " (" << chunks_sent_ << " chunks, "
                  << bytes_sent_ << " bytes in " << elapsed_seconds() << "s)" << std::endl;
        finish(protocol::status::kFinished);
        return;
    case ReadStatus::Error:
        std::cerr << "[session " << session_id_ << "] Error reading file: " << filename_ << std::endl;
        finish(protocol::status::kReadError);
        return;
    case ReadStatus::Data:
        break;
    }

    std::size_t bytes = chunk.size();
    auto self = shared_from_this();
    sink_->send_chunk(std::move(chunk), [self, bytes](const boost::system::error_code& ec) {
        self->on_chunk_sent(ec, bytes);
        });
}

void TransferWorker::on_chunk_sent(const boost::system::error_code& ec, std::size_t bytes) {
    if (ec) {
        std::cerr << "[session " << session_id_ << "] Error writing to WebSocket: " << ec.message() << std::endl;
        finish(protocol::status::kWriteError);
        return;
    }

    chunks_sent_++;
    bytes_sent_ += bytes;
    if (chunks_sent_ % 100 == 0) {
        std::cout << "[session " << session_id_ << "] Sent " << chunks_sent_ << " audio chunks of " << filename_ << std::endl;
    }

    auto self = shared_from_this();
    timer_.expires_after(options_.pacing);
    timer_.async_wait([self](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        self->next_chunk();
        });
}

void TransferWorker::finish(const char* status) {
    sink_->send_status(status);
    sink_->transfer_ended(token_);
}

double TransferWorker::elapsed_seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
}
