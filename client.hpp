#include "frame.hpp"
#include "transfer_sender.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#ifndef CLIENT_HPP
#define CLIENT_HPP

/*
 * ============================================================================
 * ROOM CLIENT - One Connection to the Relay
 * ============================================================================
 *
 * Two flows share the connection:
 *
 *   Flow 1 (I/O thread)   async_read loop -> FrameListener
 *   Flow 2 (any thread)   send() -> posted to the I/O thread -> async_write
 *                         and the caller blocks until the write finished
 *
 * Blocking send() keeps a file transfer's header and binary frames in
 * order and lets TransferSender report progress for bytes that were
 * actually written.
 * ============================================================================
 */
class RoomClient : public FrameSink {
    public:
        RoomClient(std::string host, std::string port, std::string roomId);
        ~RoomClient();

        RoomClient(const RoomClient&) = delete;
        RoomClient& operator=(const RoomClient&) = delete;

        // Resolves, connects and performs the WebSocket handshake on
        // /room/{roomId}. Throws boost::system::system_error on failure.
        void connect();

        // Starts the I/O thread. onClosed runs on that thread once the
        // connection is gone, for whatever reason.
        void startReceiving(FrameListener& listener, std::function<void()> onClosed);

        void send(const Frame& frame) override;
        bool isOpen() const override { return open_; }

        void close();

        const std::string& roomId() const { return roomId_; }
        std::string roomPath() const;

    private:
        void async_read();

        boost::asio::io_context io;
        boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
        boost::beast::flat_buffer readBuffer_;
        std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
        std::thread ioThread;

        std::string serverHost;
        std::string serverPort;
        std::string roomId_;

        FrameListener* listener_;
        std::function<void()> onClosed_;
        std::atomic<bool> open_;
};

#endif // CLIENT_HPP
