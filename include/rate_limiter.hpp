#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "endpoint_rules.hpp"
#include "token_bucket.hpp"

namespace apicache {

// Global rate and burst for paths without an endpoint rule.
struct RateLimitDefaults {
    double requests_per_second = 0.0;
    int burst = 0;
};

// One token bucket per distinct request path, created on first sight and
// kept for the life of the process. Limiting is per-process, per-path.
class RateLimiterRegistry {
public:
    RateLimiterRegistry() = default;

    /**
     * Admission decision for one request. Never blocks on the bucket.
     * @param path Decoded request path; the bucket key.
     * @param rule Matched endpoint rule, or null to use defaults.
     * @return true if a token was available.
     */
    bool allow(const std::string& path, const RateLimitRule* rule, const RateLimitDefaults& defaults);

    /**
     * Returns the bucket for path, constructing it with the rule's (or the
     * default) rate and burst if this is the first request seen for it.
     * Later calls return the same instance whatever rule they pass.
     */
    std::shared_ptr<TokenBucket> limiter_for(const std::string& path, const RateLimitRule* rule,
                                             const RateLimitDefaults& defaults);

    size_t size() const;

private:
    std::unordered_map<std::string, std::shared_ptr<TokenBucket>> limiters_;
    mutable std::shared_mutex mutex_;
};

}
