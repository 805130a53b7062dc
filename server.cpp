#include "server.hpp"
#include "session.hpp"
#include <iostream>

Server::Server(boost::asio::io_context& io, const ServerConfig& config)
    : io(io),
      config_(config),
      rooms_("room"),
      signals_("signal"),
      acceptor(io) {
    tcp::endpoint endpoint(boost::asio::ip::make_address(config_.address), config_.port);

    acceptor.open(endpoint.protocol());
    acceptor.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(boost::asio::socket_base::max_listen_connections);
}

void Server::start() {
    std::cout << "DataShare relay listening on " << config_.address << ":" << port()
              << " (" << config_.threads << " threads)" << std::endl;
    startAccept();
}

void Server::stop() {
    boost::system::error_code ec;
    acceptor.close(ec);
    if (ec) {
        std::cerr << "Error closing acceptor: " << ec.message() << std::endl;
    }
}

unsigned short Server::port() const {
    return acceptor.local_endpoint().port();
}

void Server::startAccept() {
    // Each connection gets its own strand so its handlers never run
    // concurrently, even with several threads in io.run().
    acceptor.async_accept(boost::asio::make_strand(io),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec) {
                auto session = std::make_shared<Session>(
                    std::move(socket), rooms_, signals_, config_.maxQueuedBytes);
                session->start();
                std::cout << "New client connected" << std::endl;
            } else if (ec == boost::asio::error::operation_aborted) {
                return;  // acceptor closed by stop()
            } else {
                std::cerr << "Accept error: " << ec.message() << std::endl;
            }
            startAccept();
        });
}
