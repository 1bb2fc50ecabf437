#include <gtest/gtest.h>
#include <boost/program_options/errors.hpp>
#include <stdexcept>
#include <vector>
#include "headers/config.hpp"

namespace {

    AppConfig parse(std::vector<const char*> args) {
        args.insert(args.begin(), "audio-stream");
        return parseCommandLine(static_cast<int>(args.size()), args.data());
    }

}

TEST(ConfigTest, DefaultsToServer) {
    AppConfig config = parse({});
    EXPECT_EQ(config.mode, AppConfig::Mode::Server);
    EXPECT_EQ(config.server.address, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.server.resource_dir, "resource");
    EXPECT_EQ(config.server.static_dir, "static");
    EXPECT_EQ(config.server.transfer.chunk_size, 8192u);
    EXPECT_EQ(config.server.transfer.pacing.count(), 20);
    EXPECT_EQ(config.server.threads, 1);
}

TEST(ConfigTest, ServerOptions) {
    AppConfig config = parse({ "server", "--port", "9000", "--address", "127.0.0.1",
        "--resources", "/srv/audio", "--chunk-size", "4096", "--pacing-ms", "0", "--threads", "4" });
    EXPECT_EQ(config.mode, AppConfig::Mode::Server);
    EXPECT_EQ(config.server.port, 9000);
    EXPECT_EQ(config.server.address, "127.0.0.1");
    EXPECT_EQ(config.server.resource_dir, "/srv/audio");
    EXPECT_EQ(config.server.transfer.chunk_size, 4096u);
    EXPECT_EQ(config.server.transfer.pacing.count(), 0);
    EXPECT_EQ(config.server.threads, 4);
}

TEST(ConfigTest, ClientOptions) {
    AppConfig config = parse({ "client", "-f", "sample.mp3", "--host", "10.0.0.2", "-p", "9000" });
    EXPECT_EQ(config.mode, AppConfig::Mode::Client);
    EXPECT_EQ(config.client.filename, "sample.mp3");
    EXPECT_EQ(config.client.output, "sample.mp3");
    EXPECT_EQ(config.client.host, "10.0.0.2");
    EXPECT_EQ(config.client.port, "9000");
    EXPECT_EQ(config.client.target, "/ws");
}

TEST(ConfigTest, Help) {
    EXPECT_EQ(parse({ "--help" }).mode, AppConfig::Mode::Help);
    EXPECT_NE(usage("audio-stream").find("--chunk-size"), std::string::npos);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(parse({ "client" }), std::invalid_argument);
    EXPECT_THROW(parse({ "relay" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--chunk-size", "0" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--chunk-size", "100000" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--pacing-ms=-5" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--threads", "0" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--port", "70000" }), std::invalid_argument);
}

TEST(ConfigTest, RejectsUnknownOptions) {
    EXPECT_THROW(parse({ "--volume", "11" }), boost::program_options::error);
    EXPECT_THROW(parse({ "--port", "eighty" }), boost::program_options::error);
}
