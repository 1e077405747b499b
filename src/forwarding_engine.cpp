#include "forwarding_engine.hpp"
#include "cache_key.hpp"
#include "cached_entry.hpp"
#include "metrics.hpp"
#include "request_target.hpp"

#include <boost/asio/execution.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <chrono>
#include <sstream>

namespace apicache {

namespace {

ForwardingEngine::Response text_error(http::status status, unsigned version, const char* message) {
    ForwardingEngine::Response res{status, version};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set("X-Content-Type-Options", "nosniff");
    res.body() = std::string(message) + "\n";
    res.prepare_payload();
    return res;
}

// 1xx, 204 and 304 never carry a body or a Content-Length.
bool is_bodiless_status(unsigned status) {
    return status / 100 == 1 || status == 204 || status == 304;
}

std::string format_seconds(double value) {
    std::stringstream ss;
    ss.precision(3);
    ss << std::fixed << value;
    return ss.str();
}

const char* reason_to_string(RequestContext::Reason reason) {
    switch (reason) {
        case RequestContext::Reason::client_gone: return "client_gone";
        case RequestContext::Reason::deadline: return "deadline";
        default: return "none";
    }
}

}

RetryPolicy RetryPolicy::from_config(const ServerConfig::Retry& config) {
    RetryPolicy policy;
    policy.enabled = config.enabled;
    policy.max_attempts = config.max_attempts;
    policy.initial_backoff = config.initial_backoff;
    policy.max_backoff = config.max_backoff;
    policy.backoff_multiplier = config.backoff_multiplier;
    policy.retryable_status_codes = config.retryable_status_codes;
    return policy;
}

int RetryPolicy::attempt_budget() const {
    if (!enabled) return 1;
    return max_attempts > 0 ? max_attempts : 1;
}

bool RetryPolicy::is_retryable(int status) const {
    if (!enabled) return false;
    return std::find(retryable_status_codes.begin(), retryable_status_codes.end(), status)
        != retryable_status_codes.end();
}

Duration RetryPolicy::next_backoff(Duration current) const {
    Duration next(static_cast<Duration::rep>(static_cast<double>(current.count()) * backoff_multiplier));
    return next > max_backoff ? max_backoff : next;
}

// State of one proxied request from admission to response.
// Lives as long as a store call, upstream attempt or backoff wait holds a reference.
class ForwardOperation : public std::enable_shared_from_this<ForwardOperation> {
public:
    using Request = ForwardingEngine::Request;
    using Response = ForwardingEngine::Response;

    ForwardOperation(ForwardingEngine& engine,
                     net::any_io_executor ex,
                     Request request,
                     std::shared_ptr<RequestContext> ctx,
                     RequestInfo info,
                     ForwardingEngine::ResponseHandler handler)
        : engine_(engine)
        , executor_(ex)
        , timer_(ex)
        , request_(std::move(request))
        , ctx_(std::move(ctx))
        , info_(std::move(info))
        , handler_(std::move(handler))
        , target_(RequestTarget::parse(std::string_view(request_.target().data(), request_.target().size())))
        , method_(request_.method_string())
        , start_(std::chrono::steady_clock::now())
    {
        state_.backoff = engine_.retry_.initial_backoff;
    }

    void run();

private:
    ForwardingEngine& engine_;
    net::any_io_executor executor_;
    net::steady_timer timer_;
    Request request_;
    std::shared_ptr<RequestContext> ctx_;
    RequestInfo info_;
    ForwardingEngine::ResponseHandler handler_;

    RequestTarget target_;
    std::string method_;
    std::chrono::steady_clock::time_point start_;

    bool cacheable_ = false;
    const CacheRule* rule_ = nullptr;
    std::string cache_key_;
    Duration ttl_{0};
    RetryState state_;
    bool responded_ = false;
    bool store_pending_ = false;
    bool storing_ = false;  // miss_response_ holds the upstream answer
    Response miss_response_;

    bool admit();
    void lookup();
    void on_lookup(const StoreResult& result, const CachedEntry& entry);
    void serve_hit(const CachedEntry& entry);
    void attempt();
    void on_attempt(UpstreamOutcome outcome);
    void schedule_retry();
    void complete(Response upstream_res);
    void on_stored(const StoreResult& result);
    void respond_miss(Response res, bool stored);
    void store_abandoned();
    void cancelled();

    template <typename Call, typename Done>
    void run_store(Call call, Done done);
    void respond(Response res);

    Logger& log() { return engine_.logger_; }

    std::string header_value(http::field field) const {
        auto it = request_.find(field);
        return it == request_.end() ? "" : std::string(it->value());
    }

    std::string elapsed_ms() const {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    }
};

void ForwardOperation::run() {
    MetricsRegistry::instance().increment_counter(metric::requests_total);

    log().log(Logger::Level::INFO, Logger::EventType::REQUEST, "Incoming request", {
        {"request_id", info_.request_id},
        {"method", method_},
        {"path", target_.path},
        {"query", log().redact_query(target_.raw_query)},
        {"remote_addr", info_.remote_addr},
        {"user_agent", header_value(http::field::user_agent)}
    });

    if (!admit()) return;

    if (request_.method() != http::verb::get) {
        log().log(Logger::Level::DEBUG, Logger::EventType::REQUEST, "Non-GET request, bypassing cache", {
            {"request_id", info_.request_id}, {"method", method_}, {"path", target_.path}
        });
        attempt();
        return;
    }

    cacheable_ = true;
    lookup();
}

bool ForwardOperation::admit() {
    const auto& limits = engine_.config_.rate_limit;
    if (!limits.enabled) return true;

    const RateLimitRule* rule = engine_.resolver_.resolve_rate_limit(target_.path);
    RateLimitDefaults defaults{limits.requests_per_second, limits.burst};
    if (engine_.limiters_.allow(target_.path, rule, defaults)) {
        return true;
    }

    MetricsRegistry::instance().increment_counter(metric::rate_limited_total);
    log().log(Logger::Level::WARNING, Logger::EventType::RATE_LIMIT_HIT, "Rate limit exceeded", {
        {"request_id", info_.request_id},
        {"path", target_.path},
        {"method", method_},
        {"remote_addr", info_.remote_addr}
    });
    respond(ForwardingEngine::rate_limited_response(request_.version()));
    return false;
}

void ForwardOperation::lookup() {
    MatchResult match = engine_.resolver_.resolve_cache(target_.path, method_, target_.query);
    rule_ = match.rule;
    cache_key_ = CacheKeyGenerator::generate(method_, target_, request_, rule_);
    ttl_ = engine_.resolve_ttl(rule_);

    log().log(Logger::Level::DEBUG, Logger::EventType::REQUEST, "Cache key generated", {
        {"request_id", info_.request_id},
        {"cache_key", cache_key_},
        {"path", target_.path},
        {"method", method_},
        {"match", to_string(match.kind)},
        {"rule", rule_ ? rule_->identifier() : "default"},
        {"ttl_ms", std::to_string(ttl_.count())}
    });

    if (ctx_->is_cancelled()) {
        cancelled();
        return;
    }

    auto entry = std::make_shared<CachedEntry>();
    run_store(
        [key = cache_key_, entry](CacheStore& store) { return store.get(key, *entry); },
        [this, entry](const StoreResult& result) { on_lookup(result, *entry); });
}

void ForwardOperation::on_lookup(const StoreResult& result, const CachedEntry& entry) {
    if (result.status == StoreStatus::ok) {
        serve_hit(entry);
        return;
    }
    if (result.status == StoreStatus::error) {
        MetricsRegistry::instance().increment_counter(metric::cache_store_errors_total);
        log().log(Logger::Level::ERROR, Logger::EventType::CACHE_ERROR, "Failed to get from cache", {
            {"request_id", info_.request_id}, {"cache_key", cache_key_}, {"error", result.error}
        });
    }

    MetricsRegistry::instance().increment_counter(metric::cache_misses_total);
    log().log(Logger::Level::DEBUG, Logger::EventType::CACHE_MISS, "Cache miss", {
        {"request_id", info_.request_id}, {"cache_key", cache_key_}
    });
    attempt();
}

// Runs a blocking store call on the engine's store pool and continues with
// done on the request executor. Cancelling the context completes the
// request at once; the late store result is then dropped.
template <typename Call, typename Done>
void ForwardOperation::run_store(Call call, Done done) {
    store_pending_ = true;

    std::weak_ptr<ForwardOperation> weak = shared_from_this();
    ctx_->on_cancel([weak] {
        if (auto self = weak.lock()) {
            net::post(self->executor_, [self] {
                if (!self->store_pending_) return;
                self->store_pending_ = false;
                self->store_abandoned();
            });
        }
    });

    // Tracked so the io_context keeps running until the result is delivered
    auto work = net::prefer(executor_, net::execution::outstanding_work.tracked);
    net::post(engine_.store_pool_,
        [self = shared_from_this(), work, call = std::move(call), done = std::move(done)]() mutable {
            StoreResult result;
            try {
                result = call(self->engine_.store_);
            } catch (const std::exception& e) {
                result = StoreResult::failure(e.what());
            }
            net::post(work, [self, result = std::move(result), done = std::move(done)]() mutable {
                if (!self->store_pending_) return;
                self->store_pending_ = false;
                self->ctx_->clear_cancel_handler();
                done(result);
            });
        });
}

void ForwardOperation::serve_hit(const CachedEntry& entry) {
    Response res{http::status::ok, request_.version()};
    entry.apply_to(res);
    res.set("X-Cache", "HIT");
    res.set("X-Cache-Time", format_rfc3339(entry.cached_at));
    if (!is_bodiless_status(res.result_int())) {
        res.content_length(res.body().size());
    }

    MetricsRegistry::instance().increment_counter(metric::cache_hits_total);
    double age = std::chrono::duration<double>(std::chrono::system_clock::now() - entry.cached_at).count();
    log().log(Logger::Level::INFO, Logger::EventType::CACHE_HIT, "Request served from cache", {
        {"request_id", info_.request_id},
        {"cache", "hit"},
        {"cache_key", cache_key_},
        {"status", std::to_string(entry.status_code)},
        {"duration_ms", elapsed_ms()},
        {"cache_age_s", format_seconds(age)},
        {"body_size", std::to_string(entry.body.size())},
        {"cached_at", format_rfc3339(entry.cached_at)}
    });
    respond(std::move(res));
}

void ForwardOperation::attempt() {
    if (ctx_->is_cancelled()) {
        cancelled();
        return;
    }

    ++state_.attempt;
    log().log(Logger::Level::DEBUG, Logger::EventType::UPSTREAM, "Attempting upstream request", {
        {"request_id", info_.request_id},
        {"attempt", std::to_string(state_.attempt)},
        {"max_attempts", std::to_string(engine_.retry_.attempt_budget())},
        {"method", method_},
        {"path", target_.path}
    });

    auto self = shared_from_this();
    engine_.upstream_.async_send(executor_, request_, ctx_, [self](UpstreamOutcome outcome) {
        net::post(self->executor_, [self, outcome = std::move(outcome)]() mutable {
            self->on_attempt(std::move(outcome));
        });
    });
}

void ForwardOperation::on_attempt(UpstreamOutcome outcome) {
    const RetryPolicy& policy = engine_.retry_;
    const int budget = policy.attempt_budget();

    switch (outcome.fault) {
        case UpstreamFault::cancelled:
            cancelled();
            return;

        case UpstreamFault::body_read:
            MetricsRegistry::instance().increment_counter(metric::upstream_failures_total);
            log().log(Logger::Level::ERROR, Logger::EventType::UPSTREAM_FAILURE, "Failed to read response body", {
                {"request_id", info_.request_id},
                {"cache_key", cache_key_},
                {"attempt", std::to_string(state_.attempt)},
                {"error", outcome.ec.message()}
            });
            respond(ForwardingEngine::read_failure_response(request_.version()));
            return;

        case UpstreamFault::transport:
            if (ctx_->is_cancelled()) {
                cancelled();
                return;
            }
            if (state_.attempt < budget) {
                log().log(Logger::Level::WARNING, Logger::EventType::UPSTREAM_RETRY, "Request failed, retrying", {
                    {"request_id", info_.request_id},
                    {"attempt", std::to_string(state_.attempt)},
                    {"max_attempts", std::to_string(budget)},
                    {"error", outcome.ec.message()},
                    {"backoff_ms", std::to_string(state_.backoff.count())}
                });
                schedule_retry();
                return;
            }
            MetricsRegistry::instance().increment_counter(metric::upstream_failures_total);
            log().log(Logger::Level::ERROR, Logger::EventType::UPSTREAM_FAILURE, "All retry attempts exhausted", {
                {"request_id", info_.request_id},
                {"attempts", std::to_string(state_.attempt)},
                {"error", outcome.ec.message()},
                {"cache_key", cache_key_},
                {"path", target_.path}
            });
            respond(ForwardingEngine::bad_gateway_response(request_.version()));
            return;

        case UpstreamFault::none:
            break;
    }

    int status = static_cast<int>(outcome.response.result_int());
    if (policy.is_retryable(status) && state_.attempt < budget) {
        log().log(Logger::Level::WARNING, Logger::EventType::UPSTREAM_RETRY, "Retryable status code, retrying", {
            {"request_id", info_.request_id},
            {"attempt", std::to_string(state_.attempt)},
            {"max_attempts", std::to_string(budget)},
            {"status", std::to_string(status)},
            {"backoff_ms", std::to_string(state_.backoff.count())}
        });
        schedule_retry();
        return;
    }

    if (state_.attempt > 1) {
        log().log(Logger::Level::INFO, Logger::EventType::UPSTREAM, "Request succeeded after retry", {
            {"request_id", info_.request_id},
            {"attempt", std::to_string(state_.attempt)},
            {"status", std::to_string(status)}
        });
    }
    complete(std::move(outcome.response));
}

void ForwardOperation::schedule_retry() {
    MetricsRegistry::instance().increment_counter(metric::upstream_retries_total);

    timer_.expires_after(state_.backoff);

    std::weak_ptr<ForwardOperation> weak = shared_from_this();
    ctx_->on_cancel([weak] {
        if (auto self = weak.lock()) {
            net::post(self->executor_, [self] { self->timer_.cancel(); });
        }
    });

    timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
        self->ctx_->clear_cancel_handler();
        if (ec || self->ctx_->is_cancelled()) {
            self->cancelled();
            return;
        }
        self->state_.backoff = self->engine_.retry_.next_backoff(self->state_.backoff);
        self->attempt();
    });
}

void ForwardOperation::complete(Response upstream_res) {
    const bool head = request_.method() == http::verb::head;
    const unsigned status = upstream_res.result_int();

    Response res{upstream_res.result(), request_.version()};
    for (const auto& field : upstream_res) {
        std::string_view name(field.name_string().data(), field.name_string().size());
        if (is_hop_by_hop(name)) continue;
        if (field.name() == http::field::content_length && !head) continue;
        res.insert(field.name_string(), field.value());
    }
    res.body() = std::move(upstream_res.body());
    if (!head && !is_bodiless_status(status)) {
        res.content_length(res.body().size());
    }

    if (!cacheable_) {
        log().log(Logger::Level::INFO, Logger::EventType::UPSTREAM, "Request forwarded (non-cacheable)", {
            {"request_id", info_.request_id},
            {"method", method_},
            {"path", target_.path},
            {"status", std::to_string(status)},
            {"duration_ms", elapsed_ms()},
            {"body_size", std::to_string(res.body().size())}
        });
        respond(std::move(res));
        return;
    }

    if (status < 200 || status >= 300) {
        log().log(Logger::Level::DEBUG, Logger::EventType::CACHE_STORE, "Response not cached (non-2xx status)", {
            {"request_id", info_.request_id}, {"cache_key", cache_key_}, {"status", std::to_string(status)}
        });
        respond_miss(std::move(res), false);
        return;
    }

    if (ctx_->is_cancelled()) {
        log().log(Logger::Level::DEBUG, Logger::EventType::CACHE_STORE, "Request cancelled, response not cached", {
            {"request_id", info_.request_id}, {"cache_key", cache_key_}
        });
        respond_miss(std::move(res), false);
        return;
    }

    auto entry = std::make_shared<CachedEntry>(CachedEntry::from_response(res, std::chrono::system_clock::now()));
    miss_response_ = std::move(res);
    storing_ = true;
    run_store(
        [key = cache_key_, entry, ttl = ttl_](CacheStore& store) { return store.set(key, *entry, ttl); },
        [this](const StoreResult& result) { on_stored(result); });
}

void ForwardOperation::on_stored(const StoreResult& result) {
    if (!result.ok()) {
        MetricsRegistry::instance().increment_counter(metric::cache_store_errors_total);
        log().log(Logger::Level::ERROR, Logger::EventType::CACHE_ERROR, "Failed to cache response", {
            {"request_id", info_.request_id}, {"cache_key", cache_key_}, {"error", result.error}
        });
    } else {
        MetricsRegistry::instance().increment_counter(metric::cache_writes_total);
        log().log(Logger::Level::DEBUG, Logger::EventType::CACHE_STORE, "Response cached successfully", {
            {"request_id", info_.request_id},
            {"cache_key", cache_key_},
            {"ttl_ms", std::to_string(ttl_.count())},
            {"body_size", std::to_string(miss_response_.body().size())}
        });
    }
    respond_miss(std::move(miss_response_), result.ok());
}

// A cancelled write still answers with the upstream response.
void ForwardOperation::store_abandoned() {
    if (!storing_) {
        cancelled();
        return;
    }
    log().log(Logger::Level::DEBUG, Logger::EventType::CACHE_STORE, "Request cancelled, cache write abandoned", {
        {"request_id", info_.request_id}, {"cache_key", cache_key_}
    });
    respond_miss(std::move(miss_response_), false);
}

void ForwardOperation::respond_miss(Response res, bool stored) {
    res.set("X-Cache", "MISS");
    log().log(Logger::Level::INFO, Logger::EventType::UPSTREAM, "Request forwarded to upstream", {
        {"request_id", info_.request_id},
        {"cache", "miss"},
        {"cache_key", cache_key_},
        {"status", std::to_string(res.result_int())},
        {"duration_ms", elapsed_ms()},
        {"body_size", std::to_string(res.body().size())},
        {"cached", stored ? "true" : "false"}
    });
    respond(std::move(res));
}

void ForwardOperation::cancelled() {
    log().log(Logger::Level::WARNING, Logger::EventType::UPSTREAM_FAILURE, "Request cancelled", {
        {"request_id", info_.request_id},
        {"reason", reason_to_string(ctx_->reason())},
        {"attempt", std::to_string(state_.attempt)},
        {"path", target_.path}
    });
    respond(ForwardingEngine::bad_gateway_response(request_.version()));
}

void ForwardOperation::respond(Response res) {
    if (responded_) return;
    responded_ = true;
    auto handler = std::move(handler_);
    handler(std::move(res));
}

ForwardingEngine::ForwardingEngine(const ServerConfig& config,
                                   const EndpointResolver& resolver,
                                   RateLimiterRegistry& limiters,
                                   CacheStore& store,
                                   UpstreamClient& upstream,
                                   Logger& logger)
    : config_(config)
    , resolver_(resolver)
    , limiters_(limiters)
    , store_(store)
    , upstream_(upstream)
    , logger_(logger)
    , retry_(RetryPolicy::from_config(config.retry))
    , store_pool_(config.valkey.pool_size > 0 ? static_cast<std::size_t>(config.valkey.pool_size) : 1)
{}

void ForwardingEngine::join_store_calls() {
    store_pool_.join();
}

void ForwardingEngine::async_handle(net::any_io_executor ex,
                                    Request request,
                                    std::shared_ptr<RequestContext> ctx,
                                    RequestInfo info,
                                    ResponseHandler handler) {
    std::make_shared<ForwardOperation>(
        *this, std::move(ex), std::move(request), std::move(ctx), std::move(info), std::move(handler)
    )->run();
}

Duration ForwardingEngine::resolve_ttl(const CacheRule* rule) const {
    Duration ttl = (rule && rule->ttl.count() > 0) ? rule->ttl : config_.cache.default_ttl;
    if (config_.cache.max_ttl.count() > 0 && ttl > config_.cache.max_ttl) {
        ttl = config_.cache.max_ttl;
    }
    return ttl;
}

ForwardingEngine::Response ForwardingEngine::rate_limited_response(unsigned version) {
    Response res{http::status::too_many_requests, version};
    res.set(http::field::content_type, "application/json");
    res.body() = R"({"error":"rate limit exceeded","message":"too many requests"})";
    res.prepare_payload();
    return res;
}

ForwardingEngine::Response ForwardingEngine::bad_gateway_response(unsigned version) {
    return text_error(http::status::bad_gateway, version, "upstream service unavailable");
}

ForwardingEngine::Response ForwardingEngine::read_failure_response(unsigned version) {
    return text_error(http::status::internal_server_error, version, "failed to read upstream response");
}

}
