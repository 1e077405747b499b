#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "request_context.hpp"
#include "server_config.hpp"
#include "upstream_pool.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace apicache {

// How an upstream attempt ended.
enum class UpstreamFault {
    none,
    transport,  // resolve, connect, handshake, write or status-line failure, or timeout before headers
    body_read,  // status line received, body could not be read
    cancelled   // the request context was cancelled
};

const char* to_string(UpstreamFault fault);

struct UpstreamOutcome {
    UpstreamFault fault = UpstreamFault::none;
    beast::error_code ec;
    http::response<http::string_body> response;

    bool ok() const { return fault == UpstreamFault::none; }
};

// Parsed form of upstream.base_url.
struct UpstreamEndpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string base_path;  // without trailing slash, may be empty

    bool tls() const { return scheme == "https"; }

    // Value for the Host header: host, plus the port when it is not the scheme default.
    std::string authority() const;

    // @throws ConfigError if the URL is not absolute http(s) with a host.
    static UpstreamEndpoint parse(const std::string& base_url);
};

// Connection-scoped headers that are never forwarded in either direction.
bool is_hop_by_hop(std::string_view name);

// Performs one HTTP exchange with the upstream service.
class UpstreamClient {
public:
    using Handler = std::function<void(UpstreamOutcome)>;

    virtual ~UpstreamClient() = default;

    /**
     * Sends one attempt of the inbound request upstream.
     * @param ex Executor the exchange runs on.
     * @param request Inbound request as received from the client.
     * @param ctx Cancels the exchange promptly when signalled.
     * @param handler Invoked exactly once with the outcome.
     */
    virtual void async_send(net::any_io_executor ex,
                            const http::request<http::string_body>& request,
                            std::shared_ptr<RequestContext> ctx,
                            Handler handler) = 0;
};

// Beast/Asio client over a keep-alive connection pool, TLS via OpenSSL.
class BeastUpstreamClient : public UpstreamClient {
public:
    BeastUpstreamClient(const ServerConfig::Upstream& config, ssl::context& ssl_ctx);

    void async_send(net::any_io_executor ex,
                    const http::request<http::string_body>& request,
                    std::shared_ptr<RequestContext> ctx,
                    Handler handler) override;

    /**
     * Rewrites an inbound request for the upstream: base path prefixed to the
     * target, Host set to the upstream authority, hop-by-hop headers dropped.
     * Method, query string, other headers and body are kept.
     */
    http::request<http::string_body> prepare(const http::request<http::string_body>& inbound) const;

    // Closes pooled connections. Call before the io_context is destroyed.
    void shutdown();

private:
    UpstreamEndpoint endpoint_;
    Duration timeout_;
    ssl::context& ssl_ctx_;
    UpstreamConnectionPool pool_;
};

}
