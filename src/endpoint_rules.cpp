#include "endpoint_rules.hpp"
#include "config_loader.hpp"

#include <algorithm>

namespace apicache {

namespace {

CompiledPattern compile_pattern(const std::string& pattern, const std::string& context) {
    auto compiled = std::make_shared<const re2::RE2>(pattern, re2::RE2::Quiet);
    if (!compiled->ok()) {
        throw ConfigError("invalid " + context + " regex pattern \"" + pattern + "\": " + compiled->error());
    }
    return compiled;
}

}

const char* to_string(MatchKind kind) {
    switch (kind) {
        case MatchKind::exact: return "exact";
        case MatchKind::regex: return "regex";
        case MatchKind::query_param: return "query_param";
        case MatchKind::fallback_exact: return "fallback_exact";
        case MatchKind::fallback_regex: return "fallback_regex";
        case MatchKind::none_default: return "default";
        default: return "unknown";
    }
}

bool pattern_matches(const CompiledPattern& pattern, std::string_view subject) {
    return pattern && re2::RE2::PartialMatch(re2::StringPiece(subject.data(), subject.size()), *pattern);
}

bool CacheRule::applies_to(std::string_view method) const {
    return std::find(methods.begin(), methods.end(), method) != methods.end();
}

std::string CacheRule::identifier() const {
    if (!path.empty()) return path;
    if (!path_regex.empty()) return "regex:" + path_regex;
    return "<unknown>";
}

EndpointRuleTable EndpointRuleTable::build(const std::vector<EndpointCacheConfig>& cache_endpoints,
                                           const std::vector<EndpointRateLimitConfig>& rate_limit_endpoints) {
    EndpointRuleTable table;
    table.cache_rules_.reserve(cache_endpoints.size());
    table.rate_limit_rules_.reserve(rate_limit_endpoints.size());

    for (const auto& ep : cache_endpoints) {
        CacheRule rule;
        rule.path = ep.path;
        rule.path_regex = ep.path_regex;
        if (!ep.path_regex.empty()) {
            rule.compiled_path = compile_pattern(ep.path_regex, "cache endpoint");
        }
        rule.methods = ep.methods;
        rule.ttl = ep.ttl;
        rule.key_query_params = ep.cache_key_query_params;
        rule.key_headers = ep.cache_key_headers;
        rule.allowed_values = ep.match_query_params;

        // A parameter listed with no patterns contributes no constraint.
        for (const auto& [param, patterns] : ep.match_query_params_regex) {
            for (const auto& pattern : patterns) {
                rule.value_patterns[param].push_back(
                    compile_pattern(pattern, "query param \"" + param + "\""));
            }
        }
        table.cache_rules_.push_back(std::move(rule));
    }

    for (const auto& ep : rate_limit_endpoints) {
        RateLimitRule rule;
        rule.path = ep.path;
        rule.path_regex = ep.path_regex;
        if (!ep.path_regex.empty()) {
            rule.compiled_path = compile_pattern(ep.path_regex, "rate limit endpoint");
        }
        rule.requests_per_second = ep.requests_per_second;
        rule.burst = ep.burst;
        table.rate_limit_rules_.push_back(std::move(rule));
    }

    return table;
}

}
