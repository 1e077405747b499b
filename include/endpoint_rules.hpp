#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <re2/re2.h>

#include "server_config.hpp"

namespace apicache {

// How a request was matched to a cache rule. Logged only.
enum class MatchKind {
    exact,
    regex,
    query_param,
    fallback_exact,
    fallback_regex,
    none_default
};

const char* to_string(MatchKind kind);

// RE2 matching time is linear in the length of the subject.
// Shared so rules stay copyable.
using CompiledPattern = std::shared_ptr<const re2::RE2>;

// One compiled caching policy. Immutable once the table is built.
struct CacheRule {
    std::string path;
    std::string path_regex;
    CompiledPattern compiled_path;
    std::vector<std::string> methods;
    Duration ttl{0};
    std::vector<std::string> key_query_params;
    std::vector<std::string> key_headers;

    // Discriminators: parameter name -> allowed literal values / patterns.
    std::map<std::string, std::vector<std::string>> allowed_values;
    std::map<std::string, std::vector<CompiledPattern>> value_patterns;

    bool is_discriminating() const {
        return !allowed_values.empty() || !value_patterns.empty();
    }

    bool applies_to(std::string_view method) const;

    // Exact path, "regex:<pattern>", or "<unknown>".
    std::string identifier() const;
};

struct RateLimitRule {
    std::string path;
    std::string path_regex;
    CompiledPattern compiled_path;
    double requests_per_second = 0.0;
    int burst = 0;
};

struct MatchResult {
    const CacheRule* rule = nullptr;
    MatchKind kind = MatchKind::none_default;
};


// Ordered cache and rate-limit rules with every pattern compiled up front.
// Built once at startup and shared read-only by all request handlers.
class EndpointRuleTable {
public:
    EndpointRuleTable() = default;

    /**
     * Compiles the configured endpoints in their configured order.
     * @throws ConfigError if any path or query-parameter pattern is invalid.
     */
    static EndpointRuleTable build(const std::vector<EndpointCacheConfig>& cache_endpoints,
                                   const std::vector<EndpointRateLimitConfig>& rate_limit_endpoints);

    const std::vector<CacheRule>& cache_rules() const { return cache_rules_; }
    const std::vector<RateLimitRule>& rate_limit_rules() const { return rate_limit_rules_; }

private:
    std::vector<CacheRule> cache_rules_;
    std::vector<RateLimitRule> rate_limit_rules_;
};

// Unanchored search, like a path pattern match. False for a null pattern.
bool pattern_matches(const CompiledPattern& pattern, std::string_view subject);

}
