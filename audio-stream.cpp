#include "src/headers/client.hpp"
#include "src/headers/config.hpp"
#include "src/headers/protocol.hpp"
#include "src/headers/server.hpp"
#include <boost/program_options/errors.hpp>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

namespace {

    int runServer(const ServerConfig& config) {
        AudioLibrary library(config.resource_dir);

        HttpSettings settings;
        settings.static_dir = config.static_dir;
        settings.transfer = config.transfer;

        net::io_context io(config.threads);
        StreamServer server(io, config.address, config.port, library, settings);
        server.run();

        net::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) return;
            std::cout << "\nShutting down gracefully..." << std::endl;
            server.stop();
            io.stop();
            });

        std::cout << "Starting server on " << config.address << ":" << server.port() << std::endl;
        std::cout << "Streaming files from " << library.root().string()
                  << " in " << config.transfer.chunk_size << " byte chunks every "
                  << config.transfer.pacing.count() << "ms" << std::endl;
        std::cout << "WebSocket endpoint: ws://localhost:" << server.port() << "/ws" << std::endl;

        std::vector<std::thread> workers;
        for (int i = 1; i < config.threads; ++i) {
            workers.emplace_back([&io]() {
                io.run();
                });
        }
        io.run();

        for (auto& t : workers) {
            t.join();
        }
        return 0;
    }

    int runClient(const ClientConfig& config) {
        std::ofstream out(config.output, std::ios::binary);
        if (!out) {
            std::cerr << "Failed to open output file: " << config.output << std::endl;
            return 1;
        }

        std::cout << "Connecting to " << config.host << ":" << config.port << config.target << "..." << std::endl;
        StreamClient client(config.host, config.port, config.target);
        std::cout << "Connected to server." << std::endl;

        FetchResult result = client.fetch(config.filename, out, [](const std::string& status) {
            std::cout << "[Status] " << status << std::endl;
            });
        client.close();

        std::cout << "Received " << result.chunks << " chunks (" << result.bytes << " bytes) into "
                  << config.output << std::endl;
        return result.final_status == protocol::status::kFinished ? 0 : 1;
    }

}

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = parseCommandLine(argc, argv);
    }
    catch (const boost::program_options::error& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n\n" << usage(argv[0]) << std::endl;
        return 1;
    }
    catch (const std::invalid_argument& e) {
        std::cerr << "Invalid arguments: " << e.what() << "\n\n" << usage(argv[0]) << std::endl;
        return 1;
    }

    try {
        switch (config.mode) {
        case AppConfig::Mode::Help:
            std::cout << usage(argv[0]) << std::endl;
            return 0;
        case AppConfig::Mode::Server:
            return runServer(config.server);
        case AppConfig::Mode::Client:
            return runClient(config.client);
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
