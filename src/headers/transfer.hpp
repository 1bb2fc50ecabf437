#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "cancel_token.hpp"
#include "library.hpp"

struct TransferOptions {
    std::size_t chunk_size = 8192;
    std::chrono::milliseconds pacing{ 20 };
};

// What a transfer needs from the connection it streams to. StreamSession
// implements it over a WebSocket; every call is made from the session's strand.
class TransferSink {
public:
    using SendHandler = std::function<void(const boost::system::error_code&)>;

    virtual ~TransferSink() = default;

    virtual void send_status(const std::string& text) = 0;

    // handler runs once the frame has been written or has failed.
    virtual void send_chunk(std::string chunk, SendHandler handler) = 0;

    // Called when the transfer stops on its own (end of file, error).
    virtual void transfer_ended(const CancelTokenPtr& token) = 0;
};

class TransferWorker : public std::enable_shared_from_this<TransferWorker> {
public:
    TransferWorker(boost::asio::any_io_executor executor,
        std::shared_ptr<TransferSink> sink,
        int session_id,
        const AudioLibrary& library,
        TransferOptions options,
        std::string filename,
        CancelTokenPtr token);

    void start();

    std::uint64_t chunksSent() const { return chunks_sent_; }
    std::uint64_t bytesSent() const { return bytes_sent_; }

private:
    void next_chunk();
    void on_chunk_sent(const boost::system::error_code& ec, std::size_t bytes);
    void finish(const char* status);
    double elapsed_seconds() const;

    boost::asio::steady_timer timer_;
    std::shared_ptr<TransferSink> sink_;
    const int session_id_;
    const AudioLibrary& library_;
    TransferOptions options_;
    std::string filename_;
    CancelTokenPtr token_;
    std::unique_ptr<AudioReader> reader_;

    std::chrono::steady_clock::time_point started_;
    std::uint64_t chunks_sent_ = 0;
    std::uint64_t bytes_sent_ = 0;
};
