#include "config.hpp"
#include "room.hpp"
#include <boost/asio.hpp>

#ifndef SERVER_HPP
#define SERVER_HPP

/*
 * Server - owns the listening socket and both registries
 *
 *   /room/{id}    -> rooms_    chat and file transfer frames
 *   /signal/{id}  -> signals_  opaque payloads, same fan-out rules
 *
 * The io_context is supplied by the caller, who decides how many threads
 * run it.
 */
class Server {
    public:
        Server(boost::asio::io_context& io, const ServerConfig& config);

        void start();
        void stop();

        // The bound port; differs from the configured one when that was 0.
        unsigned short port() const;

        RoomRegistry& rooms() { return rooms_; }
        RoomRegistry& signals() { return signals_; }

    private:
        void startAccept();

        boost::asio::io_context& io;
        ServerConfig config_;
        RoomRegistry rooms_;
        RoomRegistry signals_;
        boost::asio::ip::tcp::acceptor acceptor;
};

#endif // SERVER_HPP
