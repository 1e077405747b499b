#include "cached_entry.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/json.hpp>
#include <boost/beast/core/detail/base64.hpp>

namespace http = boost::beast::http;
namespace json = boost::json;
namespace base64 = boost::beast::detail::base64;

namespace apicache {

namespace {

std::string encode_base64(const std::string& input) {
    std::string encoded;
    encoded.resize(base64::encoded_size(input.size()));
    encoded.resize(base64::encode(&encoded[0], input.data(), input.size()));
    return encoded;
}

std::string decode_base64(json::string_view input) {
    if (input.size() % 4 != 0) {
        throw EntryDecodeError("cache entry body is not valid base64");
    }
    std::string decoded;
    decoded.resize(base64::decoded_size(input.size()));
    auto result = base64::decode(&decoded[0], input.data(), input.size());
    decoded.resize(result.first);

    // decode() stops at padding or at the first character outside the alphabet
    for (size_t i = result.second; i < input.size(); ++i) {
        if (input[i] != '=') {
            throw EntryDecodeError("cache entry body is not valid base64");
        }
    }
    return decoded;
}

}

CachedEntry CachedEntry::from_response(const http::response<http::string_body>& res,
                                       std::chrono::system_clock::time_point now) {
    CachedEntry entry;
    entry.status_code = static_cast<int>(res.result_int());
    for (const auto& field : res) {
        if (field.name() == http::field::content_length) continue;
        entry.headers[std::string(field.name_string())].push_back(std::string(field.value()));
    }
    entry.body = res.body();
    entry.cached_at = now;
    return entry;
}

void CachedEntry::apply_to(http::response<http::string_body>& res) const {
    res.result(static_cast<unsigned>(status_code));
    for (const auto& [name, values] : headers) {
        for (const auto& value : values) {
            res.insert(name, value);
        }
    }
    res.body() = body;
}

std::string CachedEntry::encode() const {
    json::object headers_obj;
    for (const auto& [name, values] : headers) {
        json::array arr;
        for (const auto& value : values) {
            arr.emplace_back(value);
        }
        headers_obj[name] = std::move(arr);
    }

    json::object obj;
    obj["status_code"] = status_code;
    obj["headers"] = std::move(headers_obj);
    obj["body"] = encode_base64(body);
    obj["cached_at"] = format_rfc3339(cached_at, true);
    return json::serialize(obj);
}

CachedEntry CachedEntry::decode(std::string_view data) {
    json::error_code ec;
    json::value parsed = json::parse(json::string_view(data.data(), data.size()), ec);
    if (ec) {
        throw EntryDecodeError("cache entry is not valid JSON: " + ec.message());
    }
    if (!parsed.is_object()) {
        throw EntryDecodeError("cache entry is not a JSON object");
    }
    const auto& obj = parsed.as_object();
    CachedEntry entry;

    const json::value* status = obj.if_contains("status_code");
    if (!status || !status->is_int64()) {
        throw EntryDecodeError("cache entry has no integer status_code");
    }
    int64_t code = status->as_int64();
    if (code < 100 || code > 599) {
        throw EntryDecodeError("cache entry status_code out of range: " + std::to_string(code));
    }
    entry.status_code = static_cast<int>(code);

    if (const json::value* headers = obj.if_contains("headers"); headers && !headers->is_null()) {
        if (!headers->is_object()) {
            throw EntryDecodeError("cache entry headers must be an object");
        }
        for (const auto& kv : headers->as_object()) {
            if (!kv.value().is_array()) {
                throw EntryDecodeError("cache entry header values must be an array");
            }
            auto& out = entry.headers[std::string(kv.key())];
            for (const auto& value : kv.value().as_array()) {
                if (!value.is_string()) {
                    throw EntryDecodeError("cache entry header value must be a string");
                }
                out.push_back(std::string(value.as_string()));
            }
        }
    }

    if (const json::value* body = obj.if_contains("body"); body && !body->is_null()) {
        if (!body->is_string()) {
            throw EntryDecodeError("cache entry body must be a string");
        }
        entry.body = decode_base64(body->as_string());
    }

    const json::value* cached_at = obj.if_contains("cached_at");
    if (!cached_at || !cached_at->is_string()) {
        throw EntryDecodeError("cache entry has no cached_at timestamp");
    }
    auto tp = parse_rfc3339(std::string_view(cached_at->as_string().data(), cached_at->as_string().size()));
    if (!tp) {
        throw EntryDecodeError("cache entry cached_at is not RFC 3339");
    }
    entry.cached_at = *tp;
    return entry;
}

std::string format_rfc3339(std::chrono::system_clock::time_point tp, bool fractional) {
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);

    struct tm gmt;
    gmtime_r(&t, &gmt);

    std::stringstream ss;
    ss << std::put_time(&gmt, "%Y-%m-%dT%H:%M:%S");
    if (fractional && nanos > 0) {
        std::stringstream frac;
        frac << std::setw(9) << std::setfill('0') << nanos;
        std::string digits = frac.str();
        digits.erase(digits.find_last_not_of('0') + 1);
        ss << '.' << digits;
    }
    ss << 'Z';
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_rfc3339(std::string_view text) {
    std::string s(text);
    int year, mon, day, hour, min, sec;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    long long nanos = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (s[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 9; ++digits) nanos *= 10;
    }

    int offset_seconds = 0;
    if (pos < s.size() && (s[pos] == 'Z' || s[pos] == 'z')) {
        ++pos;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int oh, om, n = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d%n", &oh, &om, &n) != 2 || n != 5) {
            return std::nullopt;
        }
        offset_seconds = (oh * 3600 + om * 60) * (s[pos] == '-' ? -1 : 1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    struct tm gmt = {};
    gmt.tm_year = year - 1900;
    gmt.tm_mon = mon - 1;
    gmt.tm_mday = day;
    gmt.tm_hour = hour;
    gmt.tm_min = min;
    gmt.tm_sec = sec;
    std::time_t t = timegm(&gmt);

    auto tp = std::chrono::system_clock::from_time_t(t - offset_seconds);
    return tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
}

}
