#include "endpoint_resolver.hpp"

#include <algorithm>

namespace apicache {

namespace {

// Empty or absent values never satisfy a constraint.
const std::string* first_value(const QueryParams& query, const std::string& name) {
    auto it = query.find(name);
    if (it == query.end() || it->second.empty() || it->second.front().empty()) {
        return nullptr;
    }
    return &it->second.front();
}

}

EndpointResolver::EndpointResolver(const EndpointRuleTable& table)
    : table_(table)
{}

MatchResult EndpointResolver::resolve_cache(std::string_view path, std::string_view method,
                                            const QueryParams& query) const {
    const CacheRule* fallback = nullptr;
    MatchKind fallback_kind = MatchKind::fallback_exact;

    for (const auto& rule : table_.cache_rules()) {
        if (!rule.applies_to(method)) continue;

        MatchKind path_kind = MatchKind::exact;
        if (!rule.path.empty() && rule.path == path) {
            path_kind = MatchKind::exact;
        } else if (pattern_matches(rule.compiled_path, path)) {
            path_kind = MatchKind::regex;
        } else {
            continue;
        }

        if (!rule.is_discriminating()) {
            if (!fallback) {
                fallback = &rule;
                fallback_kind = (path_kind == MatchKind::regex) ? MatchKind::fallback_regex
                                                                : MatchKind::fallback_exact;
            }
            continue;
        }

        if (query_constraints_hold(rule, query)) {
            return {&rule, MatchKind::query_param};
        }
    }

    if (fallback) {
        return {fallback, fallback_kind};
    }
    return {nullptr, MatchKind::none_default};
}

bool EndpointResolver::query_constraints_hold(const CacheRule& rule, const QueryParams& query) {
    for (const auto& [param, allowed] : rule.allowed_values) {
        const std::string* value = first_value(query, param);
        if (!value) return false;
        if (std::find(allowed.begin(), allowed.end(), *value) == allowed.end()) return false;
    }

    for (const auto& [param, patterns] : rule.value_patterns) {
        const std::string* value = first_value(query, param);
        if (!value) return false;
        bool matched = std::any_of(patterns.begin(), patterns.end(), [value](const CompiledPattern& re) {
            return pattern_matches(re, *value);
        });
        if (!matched) return false;
    }
    return true;
}

const RateLimitRule* EndpointResolver::resolve_rate_limit(std::string_view path) const {
    const auto& rules = table_.rate_limit_rules();

    for (const auto& rule : rules) {
        if (!rule.path.empty() && rule.path == path) return &rule;
    }
    for (const auto& rule : rules) {
        if (pattern_matches(rule.compiled_path, path)) return &rule;
    }
    return nullptr;
}

}
