#pragma once

#include <string>
#include <string_view>
#include <boost/beast/http/fields.hpp>

#include "endpoint_rules.hpp"
#include "request_target.hpp"

namespace apicache {

// Derives the store key for a cacheable request.
class CacheKeyGenerator {
public:
    static constexpr const char* key_prefix = "cache:";

    /**
     * Builds "method:path[:q1=v1&q2=v2][:H1=v1|H2=v2]" from the request and
     * hashes it with SHA-256.
     * Only the query parameters and headers the rule names contribute, each
     * by its first non-empty value, sorted, so unconfigured client variance
     * never fragments the cache.
     * @param rule Matched rule, or null for the default policy.
     * @return "cache:" followed by 64 lowercase hex characters.
     */
    static std::string generate(std::string_view method,
                                const RequestTarget& target,
                                const boost::beast::http::fields& headers,
                                const CacheRule* rule);

    static std::string sha256_hex(const std::string& input);
};

}
