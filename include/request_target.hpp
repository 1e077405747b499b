#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apicache {

// Query parameter name -> every value supplied, in arrival order.
using QueryParams = std::map<std::string, std::vector<std::string>>;

// An inbound request-target split into its routing parts.
struct RequestTarget {
    std::string path;       // percent-decoded, used for matching and keys
    std::string raw_path;   // as received, used when forwarding
    std::string raw_query;  // without the leading '?'
    QueryParams query;

    // Accepts origin-form ("/a?b=c") and absolute-form ("http://h/a?b=c").
    static RequestTarget parse(std::string_view target);

    // First value supplied for a parameter, or an empty string.
    // Repeated parameters are only ever evaluated by their first value.
    std::string first_value(const std::string& name) const;
};

// Decodes %XX escapes, and '+' as space when form_encoded is set.
// Returns nullopt on a malformed escape.
std::optional<std::string> url_decode(std::string_view input, bool form_encoded);

// application/x-www-form-urlencoded parsing; malformed pairs are dropped.
QueryParams parse_query(std::string_view raw_query);

/**
 * Replaces the values of the listed parameters with [REDACTED] so that
 * credentials passed in query strings never reach the logs. Parameter order
 * is preserved.
 */
std::string redact_query(std::string_view raw_query, const std::vector<std::string>& names);

}
