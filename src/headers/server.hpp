#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <string>
#include "http.hpp"
#include "library.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

class StreamServer {
public:
    // Binds immediately; throws boost::system::system_error when the
    // address is unusable. Port 0 picks a free port.
    StreamServer(net::io_context& ioc, const std::string& address, unsigned short port,
        const AudioLibrary& library, HttpSettings settings);

    void run();
    void stop();

    unsigned short port() const;

private:
    void do_accept();

    net::io_context& io_context_;
    tcp::acceptor acceptor_;
    const AudioLibrary& library_;
    const HttpSettings settings_;
    std::atomic<int> next_client_no_{ 1 };
};
