#pragma once

#include <boost/beast/http.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/thread_pool.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "cache_store.hpp"
#include "endpoint_resolver.hpp"
#include "logger.hpp"
#include "rate_limiter.hpp"
#include "request_context.hpp"
#include "server_config.hpp"
#include "upstream_client.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;

namespace apicache {

// Retry settings with the decisions derived from them.
struct RetryPolicy {
    bool enabled = true;
    int max_attempts = 3;
    Duration initial_backoff{100};
    Duration max_backoff{2000};
    double backoff_multiplier = 2.0;
    std::vector<int> retryable_status_codes;

    static RetryPolicy from_config(const ServerConfig::Retry& config);

    // Total attempts allowed: 1 when disabled, otherwise max_attempts (at least 1).
    int attempt_budget() const;

    // Only ever true while retry is enabled.
    bool is_retryable(int status) const;

    // current * multiplier, capped at max_backoff.
    Duration next_backoff(Duration current) const;
};

// Per-request retry bookkeeping. Discarded when the request completes.
struct RetryState {
    int attempt = 0;
    Duration backoff{0};
};

struct RequestInfo {
    std::string request_id;
    std::string remote_addr;
};

class ForwardOperation;

// Per-request orchestration: admission, cache lookup, retrying upstream call,
// cache population and response assembly.
// Store calls block, so they run on a private pool of valkey.pool_size
// threads; the request waits for them on its own executor and abandons them
// as soon as its context is cancelled.
class ForwardingEngine {
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using ResponseHandler = std::function<void(Response)>;

    ForwardingEngine(const ServerConfig& config,
                     const EndpointResolver& resolver,
                     RateLimiterRegistry& limiters,
                     CacheStore& store,
                     UpstreamClient& upstream,
                     Logger& logger);

    /**
     * Handles one proxied request asynchronously.
     * @param ex Executor for backoff timers and continuations (the session strand).
     * @param ctx Cancelled on client disconnect or deadline; stops all work.
     * @param handler Receives the response to send, exactly once.
     */
    void async_handle(net::any_io_executor ex,
                      Request request,
                      std::shared_ptr<RequestContext> ctx,
                      RequestInfo info,
                      ResponseHandler handler);

    // Rule TTL if positive, else the default; capped by cache.max_ttl when set.
    Duration resolve_ttl(const CacheRule* rule) const;

    const RetryPolicy& retry_policy() const { return retry_; }

    // Waits for store calls already handed to the store pool. Call once the
    // io threads have stopped and before the io_context is destroyed.
    void join_store_calls();

    static Response rate_limited_response(unsigned version);
    static Response bad_gateway_response(unsigned version);
    static Response read_failure_response(unsigned version);

private:
    friend class ForwardOperation;

    const ServerConfig& config_;
    const EndpointResolver& resolver_;
    RateLimiterRegistry& limiters_;
    CacheStore& store_;
    UpstreamClient& upstream_;
    Logger& logger_;
    RetryPolicy retry_;
    net::thread_pool store_pool_;
};

}
