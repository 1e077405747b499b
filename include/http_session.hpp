#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/optional.hpp>
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "server_config.hpp"
#include "forwarding_engine.hpp"
#include "logger.hpp"
#include "request_context.hpp"
#include "handlers/health_handler.hpp"
#include "handlers/admin_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace apicache {

class HttpSession;

// Shared between the listener, the sessions and the shutdown path.
class ServerState {
public:
    using SessionPtr = std::shared_ptr<HttpSession>;
    using WeakSessionPtr = std::weak_ptr<HttpSession>;

    std::atomic<bool> draining{false};
    std::atomic<int> active_sessions{0};

    void add_session(const SessionPtr& session);
    void remove_session(HttpSession* session);

    /**
     * Marks the server as draining and closes every session that is waiting
     * for its next request. Sessions with a request in progress finish it
     * and then close.
     */
    void begin_drain();

private:
    std::unordered_map<HttpSession*, WeakSessionPtr> sessions_;
    mutable std::shared_mutex sessions_mutex_;
};

// One client connection: reads HTTP/1.1 requests, routes them, writes responses.
// Every handler runs on the connection's strand.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        tcp::socket&& socket,
        const ServerConfig& config,
        ForwardingEngine& engine,
        CacheStore& store,
        Logger& logger,
        ServerState& state
    );

    ~HttpSession();

    void run();

    // Closes the connection if no part of a request has arrived yet.
    // Safe to call from any thread.
    void close_if_idle();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    const ServerConfig& config_;
    ForwardingEngine& engine_;
    Logger& logger_;
    ServerState& state_;

    // Handlers
    HealthHandler health_handler_;
    AdminHandler admin_handler_;

    std::string remote_addr_;
    std::string request_id_;
    bool keep_alive_ = false;
    bool reading_ = false;
    std::size_t requests_served_ = 0;

    // Per proxied request
    std::shared_ptr<RequestContext> ctx_;
    net::steady_timer deadline_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request(http::request<http::string_body>&& req);
    void forward(http::request<http::string_body>&& req);
    void on_forwarded(ForwardingEngine::Response&& res);

    void watch_disconnect(std::shared_ptr<RequestContext> ctx);
    void stop_request_watchers();

    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();

    bool is_loopback() const;

    http::response<http::string_body> handle_not_found(unsigned version);
    http::response<http::string_body> handle_payload_too_large();
};

}
