#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <boost/beast/http.hpp>

namespace apicache {

// A stored entry could not be decoded. Treated as a cache-backend fault.
class EntryDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The unit written to the key-value store for a cached upstream response.
struct CachedEntry {
    int status_code = 0;
    std::map<std::string, std::vector<std::string>> headers;
    std::string body;
    std::chrono::system_clock::time_point cached_at;

    /**
     * Captures status, headers and body of a response about to be sent.
     * Content-Length is not kept; it is recomputed when the entry is served.
     */
    static CachedEntry from_response(const boost::beast::http::response<boost::beast::http::string_body>& res,
                                     std::chrono::system_clock::time_point now);

    // Writes status, every stored header value and the body into res.
    void apply_to(boost::beast::http::response<boost::beast::http::string_body>& res) const;

    /**
     * JSON document: {"status_code", "headers": {name: [values]},
     * "body": base64, "cached_at": RFC 3339 with fractional seconds}.
     */
    std::string encode() const;

    // @throws EntryDecodeError on malformed JSON, base64 or field types.
    static CachedEntry decode(std::string_view data);
};

// "2006-01-02T15:04:05Z", optionally with trailing-zero-trimmed nanoseconds.
std::string format_rfc3339(std::chrono::system_clock::time_point tp, bool fractional = false);

// Accepts "Z" or "+hh:mm"/"-hh:mm" offsets and an optional fraction.
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(std::string_view text);

}
