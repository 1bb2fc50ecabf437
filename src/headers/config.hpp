#pragma once

#include <string>
#include "transfer.hpp"

struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8080;
    std::string resource_dir = "resource";
    std::string static_dir = "static";
    TransferOptions transfer;
    int threads = 1;
};

struct ClientConfig {
    std::string host = "127.0.0.1";
    std::string port = "8080";
    std::string target = "/ws";
    std::string filename;
    std::string output;
};

struct AppConfig {
    enum class Mode { Server, Client, Help };

    Mode mode = Mode::Server;
    ServerConfig server;
    ClientConfig client;
};

// Throws boost::program_options::error on unknown or malformed options and
// std::invalid_argument on values out of range.
AppConfig parseCommandLine(int argc, const char* const argv[]);

std::string usage(const std::string& program);
