#include "headers/server.hpp"
#include <iostream>

StreamServer::StreamServer(net::io_context& ioc, const std::string& address, unsigned short port,
    const AudioLibrary& library, HttpSettings settings)
    : io_context_(ioc),
      acceptor_(net::make_strand(ioc)),
      library_(library),
      settings_(std::move(settings)) {
    tcp::endpoint endpoint(net::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(net::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(net::socket_base::max_listen_connections);
}

void StreamServer::run() {
    do_accept();
}

void StreamServer::stop() {
    net::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        });
}

unsigned short StreamServer::port() const {
    return acceptor_.local_endpoint().port();
}

void StreamServer::do_accept() {
    // Each connection gets its own strand; session state is only touched there.
    acceptor_.async_accept(net::make_strand(io_context_), [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
            std::cout << "Listener stopped." << std::endl;
            return;
        }
        if (!ec) {
            int id = next_client_no_++;
            std::cout << "New client connected! Connection no: " << id << std::endl;
            std::make_shared<HttpConnection>(std::move(socket), id, library_, settings_)->run();
        }
        else {
            std::cout << "Accept failed: " << ec.message() << std::endl;
        }
        do_accept();
        });
}
