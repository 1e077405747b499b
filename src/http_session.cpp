#include "http_session.hpp"
#include "request_id.hpp"
#include "handlers/admin_auth.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/json.hpp>
#include <vector>

namespace json = boost::json;

namespace apicache {

namespace {

constexpr std::size_t max_request_id_length = 128;

// Inbound X-Request-ID when usable, otherwise a fresh one.
std::string resolve_request_id(const http::fields& fields) {
    auto it = fields.find(RequestIdGenerator::header_name);
    if (it != fields.end() && !it->value().empty() && it->value().size() <= max_request_id_length) {
        return std::string(it->value());
    }
    return RequestIdGenerator::generate();
}

}

void ServerState::add_session(const SessionPtr& session) {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    sessions_[session.get()] = session;
}

void ServerState::remove_session(HttpSession* session) {
    std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
    sessions_.erase(session);
}

void ServerState::begin_drain() {
    draining = true;

    std::vector<SessionPtr> sessions;
    {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
        sessions.reserve(sessions_.size());
        for (const auto& [ptr, weak] : sessions_) {
            if (auto session = weak.lock()) {
                sessions.push_back(std::move(session));
            }
        }
    }

    for (const auto& session : sessions) {
        session->close_if_idle();
    }
}

HttpSession::HttpSession(
    tcp::socket&& socket,
    const ServerConfig& config,
    ForwardingEngine& engine,
    CacheStore& store,
    Logger& logger,
    ServerState& state
)
    : stream_(std::move(socket))
    , config_(config)
    , engine_(engine)
    , logger_(logger)
    , state_(state)
    , admin_handler_(config, store, logger)
    , deadline_(stream_.get_executor())
{
    ++state_.active_sessions;

    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

HttpSession::~HttpSession() {
    state_.remove_session(this);
    --state_.active_sessions;
}

void HttpSession::run() {
    state_.add_session(shared_from_this());

    // Start on the connection strand
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::close_if_idle() {
    net::dispatch(stream_.get_executor(), [self = shared_from_this()] {
        if (!self->reading_ || self->parser_->got_some() || self->buffer_.size() > 0) return;
        beast::error_code ec;
        self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        self->stream_.socket().close(ec);
    });
}

void HttpSession::do_read() {
    if (state_.draining.load() && requests_served_ > 0) {
        return do_close();
    }

    reading_ = true;
    parser_.emplace();
    parser_->body_limit(config_.server.max_body_size);

    // The first request gets read_timeout; later ones on a kept-alive
    // connection may sit idle for idle_timeout.
    Duration timeout = requests_served_ == 0 ? config_.server.read_timeout : config_.server.idle_timeout;
    if (timeout.count() > 0) {
        stream_.expires_after(timeout);
    } else {
        stream_.expires_never();
    }

    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    reading_ = false;
    if (ec == http::error::end_of_stream) {
        return do_close();
    }
    if (ec && ec != http::error::body_limit) {
        if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
            logger_.log(Logger::Level::DEBUG, Logger::EventType::REQUEST, "Read failed",
                        {{"remote_addr", remote_addr_}, {"error", ec.message()}});
        }
        return;
    }

    try {
        request_id_ = resolve_request_id(parser_->get());
    } catch (const std::exception& e) {
        logger_.log(Logger::Level::ERROR, Logger::EventType::REQUEST, "Failed to assign request id",
                    {{"remote_addr", remote_addr_}, {"error", e.what()}});
        return do_close();
    }

    if (ec == http::error::body_limit) {
        logger_.log(Logger::Level::WARNING, Logger::EventType::REQUEST, "Request body too large", {
            {"request_id", request_id_},
            {"remote_addr", remote_addr_},
            {"limit", std::to_string(config_.server.max_body_size)}
        });
        keep_alive_ = false;
        send_response(handle_payload_too_large());
        return;
    }

    handle_request(parser_->release());
}

void HttpSession::handle_request(http::request<http::string_body>&& req) {
    ++requests_served_;
    keep_alive_ = req.keep_alive();

    // Proxied work is bounded by the request deadline instead
    stream_.expires_never();

    auto target = req.target();
    auto path = target.substr(0, target.find('?'));
    auto method = req.method();

    // --- Routing Table ---
    if (path == "/health" && method == http::verb::get) {
        send_response(health_handler_.handle_health(req.version()));
    } else if (path == "/metrics" && method == http::verb::get) {
        if (is_loopback() || verify_admin_token(config_, req)) {
            send_response(health_handler_.handle_metrics(req.version()));
        } else {
            send_response(handle_not_found(req.version()));
        }
    } else if (path == "/admin/cache" && method == http::verb::delete_) {
        send_response(admin_handler_.handle_purge(req, remote_addr_, request_id_));
    } else {
        forward(std::move(req));
    }
}

void HttpSession::forward(http::request<http::string_body>&& req) {
    auto ctx = std::make_shared<RequestContext>();
    ctx_ = ctx;

    if (config_.server.write_timeout.count() > 0) {
        deadline_.expires_after(config_.server.write_timeout);
        deadline_.async_wait([ctx](beast::error_code ec) {
            if (!ec) ctx->cancel(RequestContext::Reason::deadline);
        });
    }
    watch_disconnect(ctx);

    RequestInfo info{request_id_, remote_addr_};
    engine_.async_handle(
        stream_.get_executor(), std::move(req), ctx, std::move(info),
        [self = shared_from_this()](ForwardingEngine::Response res) {
            self->on_forwarded(std::move(res));
        });
}

void HttpSession::on_forwarded(ForwardingEngine::Response&& res) {
    stop_request_watchers();
    send_response(std::move(res));
}

// A readable socket with nothing to read means the peer closed its side.
void HttpSession::watch_disconnect(std::shared_ptr<RequestContext> ctx) {
    stream_.socket().async_wait(
        tcp::socket::wait_read,
        [self = shared_from_this(), ctx](beast::error_code ec) {
            if (ec || ctx != self->ctx_ || ctx->is_cancelled()) return;

            beast::error_code avail_ec;
            std::size_t pending = self->stream_.socket().available(avail_ec);
            if (avail_ec || pending == 0) {
                ctx->cancel(RequestContext::Reason::client_gone);
            }
        });
}

void HttpSession::stop_request_watchers() {
    deadline_.cancel();
    beast::error_code ec;
    stream_.socket().cancel(ec);
    ctx_.reset();
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    res.set(RequestIdGenerator::header_name, request_id_);
    res.keep_alive(keep_alive_ && !state_.draining.load());

    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));

    if (config_.server.write_timeout.count() > 0) {
        stream_.expires_after(config_.server.write_timeout);
    }

    auto self = shared_from_this();
    http::async_write(
        stream_,
        *sp,
        [self, sp](beast::error_code ec, std::size_t bytes) {
            self->on_write(sp->need_eof(), ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        logger_.log(Logger::Level::DEBUG, Logger::EventType::REQUEST, "Write failed", {
            {"request_id", request_id_}, {"remote_addr", remote_addr_}, {"error", ec.message()}
        });
        return;
    }

    if (close) {
        return do_close();
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

bool HttpSession::is_loopback() const {
    beast::error_code ec;
    auto address = net::ip::make_address(remote_addr_, ec);
    return !ec && address.is_loopback();
}

http::response<http::string_body> HttpSession::handle_not_found(unsigned version) {
    json::object response;
    response["error"] = "Not Found";

    http::response<http::string_body> res{http::status::not_found, version};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::server, "api-cache");
    res.body() = json::serialize(response);
    res.prepare_payload();
    return res;
}

http::response<http::string_body> HttpSession::handle_payload_too_large() {
    http::response<http::string_body> res{http::status::payload_too_large, parser_->get().version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set("X-Content-Type-Options", "nosniff");
    res.body() = "request body too large\n";
    res.prepare_payload();
    return res;
}

}
