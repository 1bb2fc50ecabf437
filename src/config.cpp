#include "headers/config.hpp"
#include <boost/program_options.hpp>
#include <sstream>
#include <stdexcept>

namespace po = boost::program_options;

namespace {

    const std::size_t kMaxChunkSize = 64 * 1024;

    po::options_description optionsDescription() {
        po::options_description general("General");
        general.add_options()
            ("help,h", "print this message")
            ("port,p", po::value<unsigned int>(), "TCP port to listen on / connect to (default: 8080)");

        po::options_description server("Server");
        server.add_options()
            ("address", po::value<std::string>(), "address to listen on (default: 0.0.0.0)")
            ("resources", po::value<std::string>(), "directory of streamable audio files (default: resource)")
            ("static", po::value<std::string>(), "directory of static web files (default: static)")
            ("chunk-size", po::value<std::size_t>(), "bytes per binary frame (default: 8192)")
            ("pacing-ms", po::value<long>(), "delay between chunks in milliseconds (default: 20)")
            ("threads", po::value<int>(), "io threads (default: 1)");

        po::options_description client("Client");
        client.add_options()
            ("host", po::value<std::string>(), "server host (default: 127.0.0.1)")
            ("target", po::value<std::string>(), "WebSocket path (default: /ws)")
            ("file,f", po::value<std::string>(), "audio file to stream")
            ("output,o", po::value<std::string>(), "where to write the received bytes (default: the file name)");

        po::options_description all;
        all.add(general).add(server).add(client);
        return all;
    }

}

std::string usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " [server|client] [options]\n\n" << optionsDescription();
    return ss.str();
}

AppConfig parseCommandLine(int argc, const char* const argv[]) {
    po::options_description visible = optionsDescription();
    po::options_description all;
    all.add(visible).add_options()
        ("mode", po::value<std::string>()->default_value("server"), "server or client");

    po::positional_options_description positional;
    positional.add("mode", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
    po::notify(vm);

    AppConfig config;
    if (vm.count("help")) {
        config.mode = AppConfig::Mode::Help;
        return config;
    }

    const std::string mode = vm["mode"].as<std::string>();
    if (mode == "server") {
        config.mode = AppConfig::Mode::Server;
    }
    else if (mode == "client") {
        config.mode = AppConfig::Mode::Client;
    }
    else {
        throw std::invalid_argument("unknown mode '" + mode + "', expected server or client");
    }

    if (vm.count("port")) {
        unsigned int port = vm["port"].as<unsigned int>();
        if (port > 65535) {
            throw std::invalid_argument("port must be between 0 and 65535");
        }
        config.server.port = static_cast<unsigned short>(port);
        config.client.port = std::to_string(port);
    }

    ServerConfig& server = config.server;
    if (vm.count("address")) server.address = vm["address"].as<std::string>();
    if (vm.count("resources")) server.resource_dir = vm["resources"].as<std::string>();
    if (vm.count("static")) server.static_dir = vm["static"].as<std::string>();
    if (vm.count("chunk-size")) {
        std::size_t chunk_size = vm["chunk-size"].as<std::size_t>();
        if (chunk_size == 0 || chunk_size > kMaxChunkSize) {
            throw std::invalid_argument("chunk-size must be between 1 and 65536 bytes");
        }
        server.transfer.chunk_size = chunk_size;
    }
    if (vm.count("pacing-ms")) {
        long pacing = vm["pacing-ms"].as<long>();
        if (pacing < 0) {
            throw std::invalid_argument("pacing-ms must not be negative");
        }
        server.transfer.pacing = std::chrono::milliseconds(pacing);
    }
    if (vm.count("threads")) {
        server.threads = vm["threads"].as<int>();
        if (server.threads < 1) {
            throw std::invalid_argument("threads must be at least 1");
        }
    }

    ClientConfig& client = config.client;
    if (vm.count("host")) client.host = vm["host"].as<std::string>();
    if (vm.count("target")) client.target = vm["target"].as<std::string>();
    if (vm.count("file")) client.filename = vm["file"].as<std::string>();
    if (vm.count("output")) client.output = vm["output"].as<std::string>();

    if (config.mode == AppConfig::Mode::Client) {
        if (client.filename.empty()) {
            throw std::invalid_argument("client mode needs --file");
        }
        if (client.output.empty()) {
            client.output = client.filename;
        }
    }
    return config;
}
