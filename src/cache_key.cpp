#include "cache_key.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>
#include <openssl/sha.h>

namespace apicache {

namespace {

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += separator;
        result += parts[i];
    }
    return result;
}

}

std::string CacheKeyGenerator::generate(std::string_view method,
                                        const RequestTarget& target,
                                        const boost::beast::http::fields& headers,
                                        const CacheRule* rule) {
    std::vector<std::string> key_parts;
    key_parts.emplace_back(method);
    key_parts.push_back(target.path);

    if (rule && !rule->key_query_params.empty()) {
        std::vector<std::string> query_parts;
        for (const auto& param : rule->key_query_params) {
            std::string value = target.first_value(param);
            if (!value.empty()) {
                query_parts.push_back(param + "=" + value);
            }
        }
        std::sort(query_parts.begin(), query_parts.end());
        if (!query_parts.empty()) {
            key_parts.push_back(join(query_parts, "&"));
        }
    }

    if (rule && !rule->key_headers.empty()) {
        std::vector<std::string> header_parts;
        for (const auto& name : rule->key_headers) {
            auto it = headers.find(name);
            if (it != headers.end() && !it->value().empty()) {
                header_parts.push_back(name + "=" + std::string(it->value()));
            }
        }
        std::sort(header_parts.begin(), header_parts.end());
        if (!header_parts.empty()) {
            key_parts.push_back(join(header_parts, "|"));
        }
    }

    return std::string(key_prefix) + sha256_hex(join(key_parts, ":"));
}

std::string CacheKeyGenerator::sha256_hex(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.c_str()), input.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

}
