#include "request_target.hpp"

#include <algorithm>
#include <cctype>

namespace apicache {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

std::optional<std::string> url_decode(std::string_view input, bool form_encoded) {
    std::string result;
    result.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (c == '%') {
            if (i + 2 >= input.size()) return std::nullopt;
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            result += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else if (c == '+' && form_encoded) {
            result += ' ';
        } else {
            result += c;
        }
    }
    return result;
}

QueryParams parse_query(std::string_view raw_query) {
    QueryParams params;
    while (!raw_query.empty()) {
        size_t amp = raw_query.find('&');
        std::string_view pair = raw_query.substr(0, amp);
        raw_query = (amp == std::string_view::npos) ? std::string_view{} : raw_query.substr(amp + 1);

        if (pair.empty() || pair.find(';') != std::string_view::npos) continue;

        size_t eq = pair.find('=');
        auto name = url_decode(pair.substr(0, eq), true);
        auto value = url_decode(eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1), true);
        if (!name || !value) continue;

        params[*name].push_back(std::move(*value));
    }
    return params;
}

RequestTarget RequestTarget::parse(std::string_view target) {
    RequestTarget result;

    // Absolute-form: strip scheme and authority.
    if (target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0) {
        size_t authority_start = target.find("://") + 3;
        size_t path_start = target.find_first_of("/?", authority_start);
        target = (path_start == std::string_view::npos) ? std::string_view{} : target.substr(path_start);
    }

    size_t qmark = target.find('?');
    std::string_view raw_path = target.substr(0, qmark);
    if (qmark != std::string_view::npos) {
        std::string_view query = target.substr(qmark + 1);
        size_t hash = query.find('#');
        result.raw_query = std::string(query.substr(0, hash));
    }
    size_t hash = raw_path.find('#');
    raw_path = raw_path.substr(0, hash);

    result.raw_path = raw_path.empty() ? "/" : std::string(raw_path);
    auto decoded = url_decode(result.raw_path, false);
    result.path = decoded ? *decoded : result.raw_path;
    result.query = parse_query(result.raw_query);
    return result;
}

std::string RequestTarget::first_value(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end() || it->second.empty()) return "";
    return it->second.front();
}

std::string redact_query(std::string_view raw_query, const std::vector<std::string>& names) {
    if (names.empty() || raw_query.empty()) return std::string(raw_query);

    std::string result;
    result.reserve(raw_query.size());
    while (!raw_query.empty()) {
        size_t amp = raw_query.find('&');
        std::string_view pair = raw_query.substr(0, amp);
        raw_query = (amp == std::string_view::npos) ? std::string_view{} : raw_query.substr(amp + 1);

        size_t eq = pair.find('=');
        std::string_view raw_name = pair.substr(0, eq);
        auto name = url_decode(raw_name, true);

        if (!result.empty()) result += '&';
        if (name && std::find(names.begin(), names.end(), *name) != names.end()) {
            result.append(raw_name.data(), raw_name.size());
            result += "=[REDACTED]";
        } else {
            result.append(pair.data(), pair.size());
        }
    }
    return result;
}

}
