#include "session.hpp"
#include "util.hpp"
#include <chrono>
#include <iostream>

// ============================================================================
// ROUTING
// ============================================================================

std::optional<Route> parseRoute(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));

    static const struct {
        const char* prefix;
        Endpoint endpoint;
    } routes[] = {
        {"/room/", Endpoint::Room},
        {"/ws/", Endpoint::Room},
        {"/signal/", Endpoint::Signal},
    };

    for (const auto& route : routes) {
        std::string prefix = route.prefix;
        if (path.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        std::string segment = path.substr(prefix.size());
        if (segment.empty() || segment.find('/') != std::string::npos) {
            return std::nullopt;
        }

        try {
            std::string roomId = urlDecode(segment);
            if (roomId.empty()) {
                return std::nullopt;
            }
            return Route{route.endpoint, roomId};
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// ============================================================================
// SESSION IMPLEMENTATION - Handshake
// ============================================================================

Session::Session(tcp::socket socket, RoomRegistry& rooms, RoomRegistry& signals, size_t maxQueuedBytes)
    : ws_(std::move(socket)),
      rooms(rooms),
      signals(signals),
      registry_(nullptr),
      queuedBytes_(0),
      maxQueuedBytes_(maxQueuedBytes),
      closed_(false) {
}

void Session::start() {
    // Hop onto the strand before touching the stream.
    auto self = shared_from_this();
    boost::asio::dispatch(ws_.get_executor(), [self]() {
        self->readRequest();
    });
}

void Session::readRequest() {
    auto self = shared_from_this();
    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));

    http::async_read(ws_.next_layer(), buffer_, request_,
        [this, self](beast::error_code ec, std::size_t) {
            onRequest(ec);
        });
}

void Session::onRequest(beast::error_code ec) {
    if (ec) {
        if (ec != http::error::end_of_stream) {
            std::cerr << "Handshake read error: " << ec.message() << std::endl;
        }
        beast::get_lowest_layer(ws_).close();
        return;
    }

    std::string target(request_.target().data(), request_.target().size());
    auto route = parseRoute(target);
    if (!route) {
        reject(http::status::not_found, "Unknown endpoint: " + target);
        return;
    }
    if (!websocket::is_upgrade(request_)) {
        reject(http::status::upgrade_required, "WebSocket upgrade required");
        return;
    }

    registry_ = route->endpoint == Endpoint::Signal ? &signals : &rooms;
    roomId_ = route->roomId;

    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

    auto self = shared_from_this();
    ws_.async_accept(request_,
        [this, self](beast::error_code ec) {
            onAccept(ec);
        });
}

void Session::reject(http::status status, const std::string& reason) {
    std::cerr << "Rejected request: " << reason << std::endl;

    response_ = std::make_shared<http::response<http::string_body>>(status, request_.version());
    response_->set(http::field::content_type, "text/plain");
    response_->keep_alive(false);
    response_->body() = reason + "\n";
    response_->prepare_payload();

    auto self = shared_from_this();
    http::async_write(ws_.next_layer(), *response_,
        [this, self](beast::error_code ec, std::size_t) {
            if (ec) {
                std::cerr << "Write error: " << ec.message() << std::endl;
            }
            beast::get_lowest_layer(ws_).close();
        });
}

void Session::onAccept(beast::error_code ec) {
    if (ec) {
        std::cerr << "WebSocket accept error: " << ec.message() << std::endl;
        beast::get_lowest_layer(ws_).close();
        return;
    }

    buffer_.consume(buffer_.size());
    registry_->join(roomId_, shared_from_this());
    async_read();
}

// ============================================================================
// SESSION IMPLEMENTATION - Relay Loop
// ============================================================================

void Session::async_read() {
    auto self = shared_from_this();
    ws_.async_read(buffer_,
        [this, self](beast::error_code ec, std::size_t) {
            onRead(ec);
        });
}

void Session::onRead(beast::error_code ec) {
    if (ec) {
        if (ec == websocket::error::closed) {
            disconnect("Client disconnected");
        } else {
            disconnect("Read error: " + ec.message());
        }
        return;
    }

    std::string payload = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    Frame frame = ws_.got_text() ? Frame::text(std::move(payload))
                                 : Frame::binary(std::move(payload));
    registry_->broadcast(shared_from_this(), frame);

    async_read();
}

void Session::deliver(const Frame& frame) {
    auto self = shared_from_this();
    boost::asio::post(ws_.get_executor(), [self, frame]() {
        self->queueFrame(frame);
    });
}

void Session::queueFrame(const Frame& frame) {
    if (closed_) {
        return;
    }

    queuedBytes_ += frame.size();
    if (queuedBytes_ > maxQueuedBytes_) {
        disconnect("Outgoing queue over " + std::to_string(maxQueuedBytes_) + " bytes");
        return;
    }

    outgoingFrames.push_back(frame);
    if (outgoingFrames.size() == 1) {
        async_write();  // nothing in flight, start the write chain
    }
}

void Session::async_write() {
    if (outgoingFrames.empty() || closed_) {
        return;
    }

    auto self = shared_from_this();
    const Frame& frame = outgoingFrames.front();

    ws_.text(frame.isText());
    ws_.async_write(boost::asio::buffer(frame.getData()),
        [this, self, frame](beast::error_code ec, std::size_t) {
            if (ec) {
                onWrite(ec);
                return;
            }
            if (closed_) {
                return;
            }
            queuedBytes_ -= frame.size();
            outgoingFrames.pop_front();
            async_write();
        });
}

void Session::onWrite(beast::error_code ec) {
    // operation_aborted means disconnect() already ran; it is a no-op then.
    disconnect("Write error: " + ec.message());
}

void Session::disconnect(const std::string& reason) {
    if (closed_) {
        return;
    }
    closed_ = true;

    std::cout << reason << " (" << roomId_ << ")" << std::endl;

    if (registry_) {
        registry_->leave(shared_from_this());
    }
    outgoingFrames.clear();
    queuedBytes_ = 0;
    beast::get_lowest_layer(ws_).close();
}
