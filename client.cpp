#include "client.hpp"
#include "util.hpp"
#include <future>
#include <iostream>

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

RoomClient::RoomClient(std::string host, std::string port, std::string roomId)
    : ws_(io),
      serverHost(std::move(host)),
      serverPort(std::move(port)),
      roomId_(std::move(roomId)),
      listener_(nullptr),
      open_(false) {
}

RoomClient::~RoomClient() {
    close();
}

std::string RoomClient::roomPath() const {
    return "/room/" + urlEncode(roomId_);
}

void RoomClient::connect() {
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(serverHost, serverPort);
    beast::get_lowest_layer(ws_).connect(endpoints);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.handshake(serverHost + ":" + serverPort, roomPath());
    open_ = true;
}

void RoomClient::startReceiving(FrameListener& listener, std::function<void()> onClosed) {
    listener_ = &listener;
    onClosed_ = std::move(onClosed);

    work_ = std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        io.get_executor());
    async_read();
    ioThread = std::thread([this]() {
        io.run();
    });
}

void RoomClient::async_read() {
    ws_.async_read(readBuffer_,
        [this](beast::error_code ec, std::size_t) {
            if (ec) {
                open_ = false;
                if (ec != websocket::error::closed && ec != boost::asio::error::operation_aborted) {
                    std::cerr << "❌ Connection lost: " << ec.message() << std::endl;
                }
                if (onClosed_) {
                    onClosed_();
                }
                return;
            }

            std::string payload = beast::buffers_to_string(readBuffer_.data());
            readBuffer_.consume(readBuffer_.size());
            Frame frame = ws_.got_text() ? Frame::text(std::move(payload))
                                         : Frame::binary(std::move(payload));

            try {
                dispatchFrame(frame, *listener_);
            } catch (const std::exception& e) {
                std::cerr << "❌ Error handling frame: " << e.what() << std::endl;
            }
            async_read();
        });
}

void RoomClient::send(const Frame& frame) {
    if (!open_) {
        throw std::runtime_error("Not connected");
    }

    // Without the I/O thread there is nothing to race with.
    if (!ioThread.joinable()) {
        ws_.text(frame.isText());
        ws_.write(boost::asio::buffer(frame.getData()));
        return;
    }

    std::promise<void> done;
    std::future<void> written = done.get_future();

    boost::asio::post(io, [this, frame, &done]() {
        if (!open_) {
            done.set_exception(std::make_exception_ptr(std::runtime_error("Connection closed")));
            return;
        }
        ws_.text(frame.isText());
        ws_.async_write(boost::asio::buffer(frame.getData()),
            [frame, &done](beast::error_code ec, std::size_t) {
                if (ec) {
                    done.set_exception(std::make_exception_ptr(boost::system::system_error(ec)));
                } else {
                    done.set_value();
                }
            });
    });

    written.get();
}

void RoomClient::close() {
    bool wasOpen = open_.exchange(false);

    if (wasOpen && ioThread.joinable()) {
        std::promise<void> done;
        std::future<void> closed = done.get_future();

        boost::asio::post(io, [this, &done]() {
            ws_.async_close(websocket::close_code::normal,
                [&done](beast::error_code ec) {
                    if (ec) {
                        std::cerr << "Close error: " << ec.message() << std::endl;
                    }
                    done.set_value();
                });
        });
        closed.wait();
    } else if (wasOpen) {
        beast::error_code ec;
        ws_.close(websocket::close_code::normal, ec);
        if (ec) {
            std::cerr << "Close error: " << ec.message() << std::endl;
        }
    }

    work_.reset();
    io.stop();
    if (ioThread.joinable()) {
        ioThread.join();
    }
}
