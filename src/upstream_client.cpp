#include "upstream_client.hpp"
#include "config_loader.hpp"
#include "request_target.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <openssl/err.h>
#include <chrono>
#include <cstdint>
#include <limits>
#include <variant>

namespace apicache {

const char* to_string(UpstreamFault fault) {
    switch (fault) {
        case UpstreamFault::none: return "none";
        case UpstreamFault::transport: return "transport";
        case UpstreamFault::body_read: return "body_read";
        case UpstreamFault::cancelled: return "cancelled";
        default: return "unknown";
    }
}

std::string UpstreamEndpoint::authority() const {
    if ((scheme == "http" && port == "80") || (scheme == "https" && port == "443")) {
        return host;
    }
    return host + ":" + port;
}

UpstreamEndpoint UpstreamEndpoint::parse(const std::string& base_url) {
    UpstreamEndpoint ep;
    size_t scheme_end = base_url.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigError("upstream base_url must be an absolute URL: " + base_url);
    }
    ep.scheme = base_url.substr(0, scheme_end);
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw ConfigError("upstream base_url scheme must be http or https: " + base_url);
    }

    std::string rest = base_url.substr(scheme_end + 3);
    size_t path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    ep.base_path = (path_start == std::string::npos) ? "" : rest.substr(path_start);
    size_t query = ep.base_path.find('?');
    if (query != std::string::npos) ep.base_path.erase(query);
    while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

    if (authority.empty()) {
        throw ConfigError("upstream base_url has no host: " + base_url);
    }

    // [v6]:port, host:port or bare host
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw ConfigError("upstream base_url has a malformed IPv6 host: " + base_url);
        }
        ep.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            ep.port = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            ep.host = authority.substr(0, colon);
            ep.port = authority.substr(colon + 1);
        } else {
            ep.host = authority;
        }
    }
    if (ep.port.empty()) {
        ep.port = ep.tls() ? "443" : "80";
    }
    if (ep.host.empty()) {
        throw ConfigError("upstream base_url has no host: " + base_url);
    }
    return ep;
}

bool is_hop_by_hop(std::string_view name) {
    static const char* const hop_by_hop[] = {
        "Connection", "Proxy-Connection", "Keep-Alive", "Proxy-Authenticate",
        "Proxy-Authorization", "TE", "Trailer", "Transfer-Encoding", "Upgrade"
    };
    for (const char* h : hop_by_hop) {
        if (beast::iequals(beast::string_view(name.data(), name.size()), h)) return true;
    }
    return false;
}

namespace {

// Idle upstream connections are closed after this long.
constexpr auto idle_connection_timeout = std::chrono::seconds(90);

bool is_idempotent(http::verb method) {
    switch (method) {
        case http::verb::get:
        case http::verb::head:
        case http::verb::options:
        case http::verb::put:
        case http::verb::delete_:
        case http::verb::trace:
            return true;
        default:
            return false;
    }
}

// What a kept-alive connection the server already closed looks like.
bool is_stale_connection_error(const beast::error_code& ec) {
    return ec == http::error::end_of_stream || ec == net::error::eof ||
           ec == net::error::connection_reset || ec == net::error::broken_pipe;
}

// One attempt: claim a pooled connection (or wait for a slot), then
// (resolve, connect, TLS handshake when fresh) write, read header, read body.
// Waiting runs on the exchange's own strand; everything touching the
// connection runs on the connection's strand. The deadline covers both, the
// request context aborts either, and the handler is invoked exactly once.
class UpstreamExchange : public ConnectionWaiter, public std::enable_shared_from_this<UpstreamExchange> {
public:
    UpstreamExchange(net::any_io_executor ex,
                     ssl::context& ssl_ctx,
                     UpstreamConnectionPool& pool,
                     const UpstreamEndpoint& endpoint,
                     Duration timeout,
                     http::request<http::string_body> request,
                     std::shared_ptr<RequestContext> ctx,
                     UpstreamClient::Handler handler)
        : executor_(ex)
        , wait_strand_(net::make_strand(ex))
        , wait_timer_(wait_strand_)
        , resolver_(ex)
        , deadline_(ex)
        , ssl_ctx_(ssl_ctx)
        , pool_(pool)
        , endpoint_(endpoint)
        , timeout_(timeout)
        , request_(std::move(request))
        , ctx_(std::move(ctx))
        , handler_(std::move(handler))
        , started_(std::chrono::steady_clock::now())
    {
        parser_.body_limit(std::numeric_limits<std::uint64_t>::max());
        if (request_.method() == http::verb::head) {
            parser_.skip(true);
        }
    }

    ~UpstreamExchange() override {
        if (conn_) pool_.discard(std::move(conn_));
    }

    void run() {
        net::post(wait_strand_, [self = shared_from_this()] { self->claim(); });
    }

    void on_granted(UpstreamConnectionPtr conn) override {
        net::post(wait_strand_, [self = shared_from_this(), conn = std::move(conn)]() mutable {
            self->on_slot(std::move(conn));
        });
    }

private:
    net::any_io_executor executor_;
    net::strand<net::any_io_executor> wait_strand_;
    net::steady_timer wait_timer_;
    tcp::resolver resolver_;
    net::steady_timer deadline_;
    beast::flat_buffer buffer_;
    http::response_parser<http::string_body> parser_;

    ssl::context& ssl_ctx_;
    UpstreamConnectionPool& pool_;
    UpstreamEndpoint endpoint_;
    Duration timeout_;
    http::request<http::string_body> request_;
    std::shared_ptr<RequestContext> ctx_;
    UpstreamClient::Handler handler_;
    std::chrono::steady_clock::time_point started_;

    UpstreamConnectionPtr conn_;
    bool waiting_ = false;   // wait strand only
    bool done_ = false;      // connection strand once a slot is held
    bool timed_out_ = false;
    bool reused_ = false;

    template <typename Handler>
    auto on_conn(Handler&& handler) {
        return net::bind_executor(conn_->strand, std::forward<Handler>(handler));
    }

    UpstreamConnectionPtr open_connection(net::strand<net::any_io_executor> strand) {
        return std::make_unique<UpstreamConnection>(std::move(strand), endpoint_.tls() ? &ssl_ctx_ : nullptr);
    }

    Duration remaining() const {
        auto elapsed = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started_);
        return elapsed < timeout_ ? timeout_ - elapsed : Duration(0);
    }

    // --- Waiting for a connection slot (wait strand) ---

    void claim() {
        if (ctx_->is_cancelled()) {
            return deliver(UpstreamFault::cancelled, net::error::operation_aborted);
        }

        UpstreamConnectionPtr conn;
        if (pool_.acquire(conn, shared_from_this())) {
            return start(std::move(conn));
        }

        waiting_ = true;
        std::weak_ptr<UpstreamExchange> weak = shared_from_this();
        ctx_->on_cancel([weak] {
            if (auto self = weak.lock()) {
                net::post(self->wait_strand_, [self] {
                    if (!self->waiting_) return;
                    self->waiting_ = false;
                    self->wait_timer_.cancel();
                    self->deliver(UpstreamFault::cancelled, net::error::operation_aborted);
                });
            }
        });

        if (timeout_.count() > 0) {
            wait_timer_.expires_after(timeout_);
            wait_timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
                if (ec || !self->waiting_) return;
                self->waiting_ = false;
                self->deliver(UpstreamFault::transport, beast::error::timeout);
            });
        }
    }

    void on_slot(UpstreamConnectionPtr conn) {
        if (!waiting_) {
            // Timed out or cancelled first; hand the slot on
            if (conn) {
                pool_.release(std::move(conn));
            } else {
                pool_.discard(nullptr);
            }
            return;
        }
        waiting_ = false;
        wait_timer_.cancel();
        start(std::move(conn));
    }

    // Completes without ever having held a slot.
    void deliver(UpstreamFault fault, beast::error_code ec) {
        if (done_) return;
        done_ = true;
        ctx_->clear_cancel_handler();

        UpstreamOutcome outcome;
        outcome.fault = fault;
        outcome.ec = ec;
        auto handler = std::move(handler_);
        handler(std::move(outcome));
    }

    // --- Exchange on the connection (connection strand) ---

    void start(UpstreamConnectionPtr conn) {
        conn_ = conn ? std::move(conn) : open_connection(net::make_strand(executor_));
        net::post(conn_->strand, [self = shared_from_this()] { self->begin(); });
    }

    void begin() {
        std::weak_ptr<UpstreamExchange> weak = shared_from_this();
        ctx_->on_cancel([weak, strand = conn_->strand] {
            if (auto self = weak.lock()) {
                net::post(strand, [self] { self->abort(); });
            }
        });
        if (ctx_->is_cancelled()) {
            return finish(UpstreamFault::cancelled, net::error::operation_aborted);
        }

        if (timeout_.count() > 0) {
            Duration left = remaining();
            if (left.count() <= 0) {
                timed_out_ = true;
                return finish(UpstreamFault::transport, beast::error::timeout);
            }
            deadline_.expires_after(left);
            deadline_.async_wait(on_conn([self = shared_from_this()](beast::error_code ec) {
                if (ec) return;
                self->timed_out_ = true;
                self->abort();
            }));
        }

        if (conn_->established) {
            reused_ = true;
            return do_write();
        }
        connect();
    }

    void connect() {
        resolver_.async_resolve(
            endpoint_.host, endpoint_.port,
            on_conn(beast::bind_front_handler(&UpstreamExchange::on_resolve, shared_from_this())));
    }

    void abort() {
        if (done_) return;
        beast::error_code ignored;
        resolver_.cancel();
        conn_->lowest_layer().socket().cancel(ignored);
        conn_->lowest_layer().socket().close(ignored);
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(UpstreamFault::transport, ec);

        conn_->lowest_layer().async_connect(
            results,
            on_conn(beast::bind_front_handler(&UpstreamExchange::on_connect, shared_from_this())));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail(UpstreamFault::transport, ec);

        if (auto* tls = std::get_if<UpstreamConnection::TlsStream>(&conn_->stream)) {
            if (!SSL_set_tlsext_host_name(tls->native_handle(), endpoint_.host.c_str())) {
                beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
                return fail(UpstreamFault::transport, sni_ec);
            }
            tls->set_verify_callback(ssl::host_name_verification(endpoint_.host));
            tls->async_handshake(
                ssl::stream_base::client,
                on_conn(beast::bind_front_handler(&UpstreamExchange::on_handshake, shared_from_this())));
            return;
        }
        conn_->established = true;
        do_write();
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail(UpstreamFault::transport, ec);
        conn_->established = true;
        do_write();
    }

    void do_write() {
        auto self = shared_from_this();
        std::visit([&](auto& stream) {
            http::async_write(stream, request_,
                on_conn(beast::bind_front_handler(&UpstreamExchange::on_write, self)));
        }, conn_->stream);
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            if (retry_on_fresh_connection(ec, true)) return;
            return fail(UpstreamFault::transport, ec);
        }

        auto self = shared_from_this();
        std::visit([&](auto& stream) {
            http::async_read_header(stream, buffer_, parser_,
                on_conn(beast::bind_front_handler(&UpstreamExchange::on_read_header, self)));
        }, conn_->stream);
    }

    void on_read_header(beast::error_code ec, std::size_t) {
        if (ec) {
            if (retry_on_fresh_connection(ec, false)) return;
            return fail(UpstreamFault::transport, ec);
        }

        if (parser_.is_done()) {
            on_read(ec, 0);
            return;
        }
        auto self = shared_from_this();
        std::visit([&](auto& stream) {
            http::async_read(stream, buffer_, parser_,
                on_conn(beast::bind_front_handler(&UpstreamExchange::on_read, self)));
        }, conn_->stream);
    }

    // A reused connection the server closed while it sat idle is replaced
    // once by a fresh one. A failed write is always sent again; a response
    // that never started only for idempotent methods.
    bool retry_on_fresh_connection(const beast::error_code& ec, bool write_failed) {
        if (!reused_ || ctx_->is_cancelled() || timed_out_ || !is_stale_connection_error(ec)) return false;
        if (!write_failed && (parser_.got_some() || !is_idempotent(request_.method()))) return false;

        reused_ = false;
        buffer_.clear();
        conn_ = open_connection(conn_->strand);
        connect();
        return true;
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) return fail(UpstreamFault::body_read, ec);

        UpstreamOutcome outcome;
        outcome.response = parser_.release();
        bool keep = outcome.response.keep_alive() && buffer_.size() == 0;
        complete(std::move(outcome), keep);
    }

    void fail(UpstreamFault phase, beast::error_code ec) {
        if (ctx_->is_cancelled()) {
            finish(UpstreamFault::cancelled, ec);
        } else if (timed_out_) {
            finish(phase, beast::error::timeout);
        } else {
            finish(phase, ec);
        }
    }

    void finish(UpstreamFault fault, beast::error_code ec) {
        UpstreamOutcome outcome;
        outcome.fault = fault;
        outcome.ec = ec;
        complete(std::move(outcome), false);
    }

    void complete(UpstreamOutcome outcome, bool keep_alive) {
        if (done_) return;
        done_ = true;

        ctx_->clear_cancel_handler();
        deadline_.cancel();

        if (keep_alive && !ctx_->is_cancelled() && !timed_out_) {
            pool_.release(std::move(conn_));
        } else {
            beast::error_code ignored;
            conn_->lowest_layer().socket().shutdown(tcp::socket::shutdown_both, ignored);
            conn_->lowest_layer().socket().close(ignored);
            pool_.discard(std::move(conn_));
        }

        auto handler = std::move(handler_);
        handler(std::move(outcome));
    }
};

}

BeastUpstreamClient::BeastUpstreamClient(const ServerConfig::Upstream& config, ssl::context& ssl_ctx)
    : endpoint_(UpstreamEndpoint::parse(config.base_url))
    , timeout_(config.timeout)
    , ssl_ctx_(ssl_ctx)
    , pool_(config.max_idle_conns, config.max_conns_per_host, idle_connection_timeout)
{}

void BeastUpstreamClient::shutdown() {
    pool_.shutdown();
}

http::request<http::string_body> BeastUpstreamClient::prepare(const http::request<http::string_body>& inbound) const {
    RequestTarget target = RequestTarget::parse(std::string_view(inbound.target().data(), inbound.target().size()));

    std::string upstream_target = endpoint_.base_path + target.raw_path;
    if (!target.raw_query.empty()) {
        upstream_target += "?" + target.raw_query;
    }

    http::request<http::string_body> req{inbound.method(), upstream_target, 11};
    for (const auto& field : inbound) {
        std::string_view name(field.name_string().data(), field.name_string().size());
        if (is_hop_by_hop(name)) continue;
        if (field.name() == http::field::host || field.name() == http::field::content_length) continue;
        req.insert(field.name_string(), field.value());
    }
    req.set(http::field::host, endpoint_.authority());
    req.body() = inbound.body();
    if (!req.body().empty() || inbound.has_content_length()) {
        req.prepare_payload();
    }
    return req;
}

void BeastUpstreamClient::async_send(net::any_io_executor ex,
                                     const http::request<http::string_body>& request,
                                     std::shared_ptr<RequestContext> ctx,
                                     Handler handler) {
    std::make_shared<UpstreamExchange>(
        std::move(ex), ssl_ctx_, pool_, endpoint_, timeout_, prepare(request), std::move(ctx), std::move(handler)
    )->run();
}

}
