#include "config.hpp"
#include "server.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <iostream>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    try {
        ServerConfig config = parseServerArgs(argc, argv);

        boost::asio::io_context io(static_cast<int>(config.threads));
        Server server(io, config);
        server.start();

        // Ctrl-C / SIGTERM: stop accepting and let io.run() return.
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                std::cout << "Signal " << signo << " received, shutting down" << std::endl;
                server.stop();
                io.stop();
            }
        });

        std::vector<std::thread> workers;
        for (unsigned i = 1; i < config.threads; ++i) {
            workers.emplace_back([&io]() { io.run(); });
        }
        io.run();

        for (auto& worker : workers) {
            worker.join();
        }
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
