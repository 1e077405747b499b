#include "rate_limiter.hpp"
#include "metrics.hpp"

#include <mutex>

namespace apicache {

bool RateLimiterRegistry::allow(const std::string& path, const RateLimitRule* rule,
                                const RateLimitDefaults& defaults) {
    return limiter_for(path, rule, defaults)->allow();
}

std::shared_ptr<TokenBucket> RateLimiterRegistry::limiter_for(const std::string& path, const RateLimitRule* rule,
                                                              const RateLimitDefaults& defaults) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = limiters_.find(path);
        if (it != limiters_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Another thread may have inserted it between the two locks
    auto it = limiters_.find(path);
    if (it != limiters_.end()) {
        return it->second;
    }

    double rps = defaults.requests_per_second;
    int burst = defaults.burst;
    if (rule) {
        rps = rule->requests_per_second;
        burst = rule->burst;
    }

    auto limiter = std::make_shared<TokenBucket>(rps, burst);
    limiters_.emplace(path, limiter);
    MetricsRegistry::instance().set_gauge(metric::rate_limiters_active, static_cast<double>(limiters_.size()));
    return limiter;
}

size_t RateLimiterRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return limiters_.size();
}

}
