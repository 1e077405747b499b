#pragma once

#include <string_view>

#include "endpoint_rules.hpp"
#include "request_target.hpp"

namespace apicache {

// Decides which cache rule and which rate-limit rule govern a request.
// Stateless over an immutable rule table, so safe to share across threads.
class EndpointResolver {
public:
    explicit EndpointResolver(const EndpointRuleTable& table);

    /**
     * Walks the cache rules in configured order.
     * A rule whose query-parameter constraints all hold wins immediately.
     * The first path-matching rule without constraints is remembered and
     * wins only if no constrained rule matches anywhere in the list.
     * @return The matched rule and how it matched; rule is null when the
     *         caller must fall back to the default TTL.
     */
    MatchResult resolve_cache(std::string_view path, std::string_view method,
                              const QueryParams& query) const;

    // First exact-path rule, else first pattern rule, else null (global rate).
    const RateLimitRule* resolve_rate_limit(std::string_view path) const;

private:
    static bool query_constraints_hold(const CacheRule& rule, const QueryParams& query);

    const EndpointRuleTable& table_;
};

}
