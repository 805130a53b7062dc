#include "room.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#ifndef SESSION_HPP
#define SESSION_HPP

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

// ============================================================================
// ROUTING - Which Registry a Connection Belongs To
// ============================================================================

enum class Endpoint { Room, Signal };

struct Route {
    Endpoint endpoint;
    std::string roomId;
};

/*
 * parseRoute() - map a request target to an endpoint and room id
 *
 *   /room/{roomId}    -> Endpoint::Room   (/ws/{roomId} is accepted too)
 *   /signal/{roomId}  -> Endpoint::Signal
 *
 * The room id is one URL-decoded path segment, case preserved. A query
 * string is ignored. Anything else, including an empty id, yields no route.
 */
std::optional<Route> parseRoute(const std::string& target);

/*
 * ============================================================================
 * SESSION - One WebSocket Connection
 * ============================================================================
 *
 * Lifecycle:
 *
 *   accept ─> read HTTP upgrade ─> route ─┬─> 404 and close
 *                                        └─> websocket accept ─> join
 *                                                 │
 *                      ┌──────────────────────────┘
 *                      v
 *                async_read ─> broadcast ─> async_read ...
 *                      │
 *                  any error ─> leave
 *
 * All handlers of a Session run on its own strand, so the outgoing queue
 * needs no lock. deliver() may be called from any thread; it posts onto
 * that strand.
 * ============================================================================
 */
class Session : public Participant, public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket socket, RoomRegistry& rooms, RoomRegistry& signals, size_t maxQueuedBytes);

        void start();
        void deliver(const Frame& frame) override;

    private:
        void readRequest();
        void onRequest(beast::error_code ec);
        void reject(http::status status, const std::string& reason);
        void onAccept(beast::error_code ec);

        void async_read();
        void onRead(beast::error_code ec);

        void queueFrame(const Frame& frame);
        void async_write();
        void onWrite(beast::error_code ec);

        void disconnect(const std::string& reason);

        websocket::stream<beast::tcp_stream> ws_;
        beast::flat_buffer buffer_;
        http::request<http::string_body> request_;
        std::shared_ptr<http::response<http::string_body>> response_;

        RoomRegistry& rooms;
        RoomRegistry& signals;
        RoomRegistry* registry_;
        std::string roomId_;

        std::deque<Frame> outgoingFrames;
        size_t queuedBytes_;
        size_t maxQueuedBytes_;
        bool closed_;
};

#endif // SESSION_HPP
