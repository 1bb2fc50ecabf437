#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <chrono>
#include <limits>
#include "headers/protocol.hpp"
#include "headers/transfer.hpp"
#include "test_util.hpp"

using testing_util::TempDir;
using testing_util::makeBytes;

namespace {

    struct SinkEvent {
        bool binary;
        std::string data;
    };

    // Records what a worker sends; completes chunk writes on the io_context
    // the way a real connection would.
    class RecordingSink : public TransferSink {
    public:
        explicit RecordingSink(boost::asio::io_context& io) : io_(io) {}

        void send_status(const std::string& text) override {
            events.push_back({ false, text });
        }

        void send_chunk(std::string chunk, SendHandler handler) override {
            std::size_t index = chunks++;
            events.push_back({ true, std::move(chunk) });
            if (on_chunk) {
                on_chunk(index);
            }

            boost::system::error_code ec;
            if (index >= fail_from) {
                ec = fail_with;
            }
            boost::asio::post(io_, [handler, ec]() {
                handler(ec);
                });
        }

        void transfer_ended(const CancelTokenPtr& token) override {
            ended++;
            ended_token = token;
        }

        std::vector<std::string> statuses() const {
            std::vector<std::string> out;
            for (const auto& e : events) {
                if (!e.binary) out.push_back(e.data);
            }
            return out;
        }

        std::string payload() const {
            std::string out;
            for (const auto& e : events) {
                if (e.binary) out += e.data;
            }
            return out;
        }

        std::vector<SinkEvent> events;
        std::size_t chunks = 0;
        int ended = 0;
        CancelTokenPtr ended_token;
        std::function<void(std::size_t)> on_chunk;
        std::size_t fail_from = std::numeric_limits<std::size_t>::max();
        boost::system::error_code fail_with;

    private:
        boost::asio::io_context& io_;
    };

    // Reader that fails after handing out a number of good chunks.
    class FailingReader : public AudioReader {
    public:
        FailingReader(const fs::path& path, std::size_t good_chunks)
            : AudioReader(path), good_chunks_(good_chunks) {}

        ReadStatus readChunk(std::string& chunk, std::size_t max_bytes) override {
            if (good_chunks_ == 0) {
                chunk.clear();
                return ReadStatus::Error;
            }
            --good_chunks_;
            return AudioReader::readChunk(chunk, max_bytes);
        }

    private:
        std::size_t good_chunks_;
    };

    class FailingReadLibrary : public AudioLibrary {
    public:
        FailingReadLibrary(fs::path root, std::size_t good_chunks)
            : AudioLibrary(std::move(root)), good_chunks_(good_chunks) {}

        std::unique_ptr<AudioReader> open(const fs::path& path) const override {
            return std::make_unique<FailingReader>(path, good_chunks_);
        }

    private:
        std::size_t good_chunks_;
    };

    // Resolves names normally but the file vanishes before it is opened.
    class VanishingLibrary : public AudioLibrary {
    public:
        using AudioLibrary::AudioLibrary;

        std::unique_ptr<AudioReader> open(const fs::path& path) const override {
            return AudioLibrary::open(path.parent_path() / "gone.mp3");
        }
    };

    const int kSessionId = 7;

    class TransferTest : public ::testing::Test {
    protected:
        TransferTest()
            : library_(dir_.path()),
              sink_(std::make_shared<RecordingSink>(io_)),
              token_(std::make_shared<CancelToken>()) {
            options_.chunk_size = 4096;
            options_.pacing = std::chrono::milliseconds(0);
        }

        void stream(const std::string& filename) {
            stream(library_, filename);
        }

        void stream(const AudioLibrary& library, const std::string& filename) {
            auto worker = std::make_shared<TransferWorker>(
                io_.get_executor(), sink_, kSessionId, library, options_, filename, token_);
            worker->start();
            io_.restart();
            io_.run();
        }

        TempDir dir_;
        AudioLibrary library_;
        boost::asio::io_context io_;
        std::shared_ptr<RecordingSink> sink_;
        CancelTokenPtr token_;
        TransferOptions options_;
    };

}

TEST_F(TransferTest, StreamsWholeFileInBoundedChunks) {
    const std::string content = makeBytes(10000);
    dir_.write("sample.mp3", content);

    stream("sample.mp3");

    ASSERT_EQ(sink_->events.size(), 5u);
    EXPECT_FALSE(sink_->events[0].binary);
    EXPECT_EQ(sink_->events[0].data, "Streaming sample.mp3");
    EXPECT_EQ(sink_->events[1].data.size(), 4096u);
    EXPECT_EQ(sink_->events[2].data.size(), 4096u);
    EXPECT_EQ(sink_->events[3].data.size(), 1808u);
    EXPECT_FALSE(sink_->events[4].binary);
    EXPECT_EQ(sink_->events[4].data, protocol::status::kFinished);

    EXPECT_EQ(sink_->payload(), content);
    EXPECT_EQ(sink_->ended, 1);
    EXPECT_EQ(sink_->ended_token, token_);
}

TEST_F(TransferTest, ExactMultipleOfChunkSize) {
    dir_.write("even.wav", makeBytes(8192));

    stream("even.wav");

    EXPECT_EQ(sink_->chunks, 2u);
    EXPECT_EQ(sink_->statuses().back(), protocol::status::kFinished);
}

TEST_F(TransferTest, EmptyFileFinishesWithoutChunks) {
    dir_.write("empty.mp3", "");

    stream("empty.mp3");

    EXPECT_EQ(sink_->chunks, 0u);
    std::vector<std::string> expected = { "Streaming empty.mp3", protocol::status::kFinished };
    EXPECT_EQ(sink_->statuses(), expected);
    EXPECT_EQ(sink_->ended, 1);
}

TEST_F(TransferTest, MissingFileReportsNotFoundAndEnds) {
    stream("missing.mp3");

    std::vector<std::string> expected = { "Error: File missing.mp3 not found" };
    EXPECT_EQ(sink_->statuses(), expected);
    EXPECT_EQ(sink_->chunks, 0u);
    EXPECT_EQ(sink_->ended, 1);
}

TEST_F(TransferTest, NamesOutsideTheLibraryAreNotFound) {
    TempDir outside;
    outside.write("secret.mp3", "secret");

    stream("../" + outside.path().filename().string() + "/secret.mp3");

    ASSERT_EQ(sink_->statuses().size(), 1u);
    EXPECT_EQ(sink_->statuses()[0].compare(0, 12, "Error: File "), 0);
    EXPECT_EQ(sink_->chunks, 0u);
}

TEST_F(TransferTest, CancellationStopsAtNextIteration) {
    dir_.write("long.mp3", makeBytes(40000));
    sink_->on_chunk = [this](std::size_t index) {
        if (index == 1) token_->fire();
    };

    stream("long.mp3");

    // The chunk already handed over is still delivered; nothing after it.
    EXPECT_EQ(sink_->chunks, 2u);
    std::vector<std::string> expected = { "Streaming long.mp3" };
    EXPECT_EQ(sink_->statuses(), expected);
    EXPECT_EQ(sink_->ended, 0);
}

TEST_F(TransferTest, TokenFiredBeforeFirstReadSendsNothing) {
    dir_.write("a.mp3", makeBytes(100));
    token_->fire();

    stream("a.mp3");

    EXPECT_EQ(sink_->chunks, 0u);
    EXPECT_EQ(sink_->ended, 0);
}

TEST_F(TransferTest, SendFailureEndsTransferWithoutRetry) {
    dir_.write("a.mp3", makeBytes(40000));
    sink_->fail_from = 1;
    sink_->fail_with = boost::asio::error::broken_pipe;

    stream("a.mp3");

    EXPECT_EQ(sink_->chunks, 2u);
    std::vector<std::string> expected = { "Streaming a.mp3", protocol::status::kWriteError };
    EXPECT_EQ(sink_->statuses(), expected);
    EXPECT_EQ(sink_->ended, 1);
}

TEST_F(TransferTest, PacingDelaysEveryChunk) {
    dir_.write("paced.mp3", makeBytes(3 * 4096));
    options_.pacing = std::chrono::milliseconds(20);

    auto started = std::chrono::steady_clock::now();
    stream("paced.mp3");
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(sink_->chunks, 3u);
    EXPECT_GE(elapsed, std::chrono::milliseconds(60));
}

TEST_F(TransferTest, ReadErrorEndsTransfer) {
    dir_.write("broken.mp3", makeBytes(20000));
    FailingReadLibrary library(dir_.path(), 2);

    stream(library, "broken.mp3");

    EXPECT_EQ(sink_->chunks, 2u);
    std::vector<std::string> expected = { "Streaming broken.mp3", protocol::status::kReadError };
    EXPECT_EQ(sink_->statuses(), expected);
    EXPECT_EQ(sink_->ended, 1);
    EXPECT_EQ(sink_->ended_token, token_);
}

TEST_F(TransferTest, OpenFailureEndsTransfer) {
    dir_.write("flaky.mp3", makeBytes(100));
    VanishingLibrary library(dir_.path());

    stream(library, "flaky.mp3");

    EXPECT_EQ(sink_->chunks, 0u);
    std::vector<std::string> expected = { "Streaming flaky.mp3", protocol::status::kOpenError };
    EXPECT_EQ(sink_->statuses(), expected);
    EXPECT_EQ(sink_->ended, 1);
}

TEST_F(TransferTest, LogLinesCarryTheSessionId) {
    dir_.write("a.mp3", makeBytes(100));

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    stream("a.mp3");
    stream("missing.mp3");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_NE(out.find("[session 7] Streaming file: a.mp3"), std::string::npos);
    EXPECT_NE(out.find("[session 7] Finished streaming file: a.mp3"), std::string::npos);
    EXPECT_NE(err.find("[session 7] File not found: missing.mp3"), std::string::npos);
}
