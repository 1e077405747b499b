#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace apicache {

namespace {

bool has_value(const YAML::Node& node) {
    return node && !node.IsNull();
}

template <typename T>
void read_scalar(const YAML::Node& parent, const char* key, const std::string& section, T& out) {
    YAML::Node node = parent[key];
    if (!has_value(node)) return;
    try {
        out = node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("invalid value for " + section + "." + key + ": " + e.what());
    }
}

void read_duration(const YAML::Node& parent, const char* key, const std::string& section, Duration& out) {
    YAML::Node node = parent[key];
    if (!has_value(node)) return;
    try {
        out = ConfigLoader::parse_duration(node.as<std::string>());
    } catch (const YAML::Exception& e) {
        throw ConfigError("invalid value for " + section + "." + key + ": " + e.what());
    } catch (const ConfigError& e) {
        throw ConfigError("invalid value for " + section + "." + key + ": " + e.what());
    }
}

void read_string_map(const YAML::Node& parent, const char* key, const std::string& section,
                     std::map<std::string, std::vector<std::string>>& out) {
    YAML::Node node = parent[key];
    if (!has_value(node)) return;
    if (!node.IsMap()) {
        throw ConfigError(section + "." + key + " must be a mapping of parameter name to values");
    }
    for (const auto& entry : node) {
        std::string name = entry.first.as<std::string>();
        try {
            out[name] = entry.second.IsNull()
                ? std::vector<std::string>{}
                : entry.second.as<std::vector<std::string>>();
        } catch (const YAML::Exception& e) {
            throw ConfigError("invalid value for " + section + "." + key + "." + name + ": " + e.what());
        }
    }
}

EndpointCacheConfig parse_cache_endpoint(const YAML::Node& node, size_t index) {
    std::string section = "cache.endpoints[" + std::to_string(index) + "]";
    EndpointCacheConfig ep;
    read_scalar(node, "path", section, ep.path);
    read_scalar(node, "path_regex", section, ep.path_regex);
    read_scalar(node, "methods", section, ep.methods);
    read_duration(node, "ttl", section, ep.ttl);
    read_scalar(node, "cache_key_headers", section, ep.cache_key_headers);
    read_scalar(node, "cache_key_query_params", section, ep.cache_key_query_params);
    read_string_map(node, "match_query_params", section, ep.match_query_params);
    read_string_map(node, "match_query_params_regex", section, ep.match_query_params_regex);
    return ep;
}

EndpointRateLimitConfig parse_rate_limit_endpoint(const YAML::Node& node, size_t index) {
    std::string section = "rate_limit.endpoints[" + std::to_string(index) + "]";
    EndpointRateLimitConfig ep;
    read_scalar(node, "path", section, ep.path);
    read_scalar(node, "path_regex", section, ep.path_regex);
    read_scalar(node, "requests_per_second", section, ep.requests_per_second);
    read_scalar(node, "burst", section, ep.burst);
    return ep;
}

bool valid_port(long value) {
    return value > 0 && value <= 65535;
}

}

ServerConfig ConfigLoader::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("failed to read config file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();

    ServerConfig config = parse(ss.str());
    apply_environment(config);
    validate(config);
    return config;
}

ServerConfig ConfigLoader::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("failed to parse config file: ") + e.what());
    }

    ServerConfig config;
    if (!has_value(root)) return config;
    if (!root.IsMap()) {
        throw ConfigError("failed to parse config file: top level must be a mapping");
    }

    if (auto s = root["server"]; has_value(s)) {
        long port = config.server.port;
        read_scalar(s, "host", "server", config.server.host);
        read_scalar(s, "port", "server", port);
        if (!valid_port(port)) {
            throw ConfigError("invalid server port: " + std::to_string(port));
        }
        config.server.port = static_cast<uint16_t>(port);
        read_duration(s, "read_timeout", "server", config.server.read_timeout);
        read_duration(s, "write_timeout", "server", config.server.write_timeout);
        read_duration(s, "idle_timeout", "server", config.server.idle_timeout);
        read_scalar(s, "threads", "server", config.server.threads);
        read_scalar(s, "max_body_size", "server", config.server.max_body_size);
    }

    if (auto v = root["valkey"]; has_value(v)) {
        read_scalar(v, "host", "valkey", config.valkey.host);
        read_scalar(v, "port", "valkey", config.valkey.port);
        read_scalar(v, "password", "valkey", config.valkey.password);
        read_scalar(v, "db", "valkey", config.valkey.db);
        read_scalar(v, "max_retries", "valkey", config.valkey.max_retries);
        read_scalar(v, "pool_size", "valkey", config.valkey.pool_size);
        read_duration(v, "socket_timeout", "valkey", config.valkey.socket_timeout);
        read_duration(v, "connect_timeout", "valkey", config.valkey.connect_timeout);
    }

    if (auto c = root["cache"]; has_value(c)) {
        read_duration(c, "default_ttl", "cache", config.cache.default_ttl);
        read_duration(c, "max_ttl", "cache", config.cache.max_ttl);
        if (auto eps = c["endpoints"]; has_value(eps)) {
            if (!eps.IsSequence()) throw ConfigError("cache.endpoints must be a list");
            for (size_t i = 0; i < eps.size(); ++i) {
                config.cache.endpoints.push_back(parse_cache_endpoint(eps[i], i));
            }
        }
    }

    if (auto r = root["rate_limit"]; has_value(r)) {
        read_scalar(r, "enabled", "rate_limit", config.rate_limit.enabled);
        read_scalar(r, "requests_per_second", "rate_limit", config.rate_limit.requests_per_second);
        read_scalar(r, "burst", "rate_limit", config.rate_limit.burst);
        if (auto eps = r["endpoints"]; has_value(eps)) {
            if (!eps.IsSequence()) throw ConfigError("rate_limit.endpoints must be a list");
            for (size_t i = 0; i < eps.size(); ++i) {
                config.rate_limit.endpoints.push_back(parse_rate_limit_endpoint(eps[i], i));
            }
        }
    }

    if (auto r = root["retry"]; has_value(r)) {
        read_scalar(r, "enabled", "retry", config.retry.enabled);
        read_scalar(r, "max_attempts", "retry", config.retry.max_attempts);
        read_duration(r, "initial_backoff", "retry", config.retry.initial_backoff);
        read_duration(r, "max_backoff", "retry", config.retry.max_backoff);
        read_scalar(r, "backoff_multiplier", "retry", config.retry.backoff_multiplier);
        read_scalar(r, "retryable_status_codes", "retry", config.retry.retryable_status_codes);
    }

    if (auto u = root["upstream"]; has_value(u)) {
        read_scalar(u, "base_url", "upstream", config.upstream.base_url);
        read_duration(u, "timeout", "upstream", config.upstream.timeout);
        read_scalar(u, "max_idle_conns", "upstream", config.upstream.max_idle_conns);
        read_scalar(u, "max_conns_per_host", "upstream", config.upstream.max_conns_per_host);
    }

    if (auto l = root["logging"]; has_value(l)) {
        read_scalar(l, "level", "logging", config.logging.level);
        read_scalar(l, "format", "logging", config.logging.format);
        read_scalar(l, "output", "logging", config.logging.output);
        read_scalar(l, "file_path", "logging", config.logging.file_path);
        read_scalar(l, "redact_query_params", "logging", config.logging.redact_query_params);
    }

    read_scalar(root, "admin_token", "", config.admin_token);
    return config;
}

void ConfigLoader::apply_environment(ServerConfig& config) {
    try {
        if (const char* e = std::getenv("APICACHE_PORT")) {
            long port = std::stol(e);
            if (!valid_port(port)) throw ConfigError("invalid server port: " + std::string(e));
            config.server.port = static_cast<uint16_t>(port);
        }
        if (const char* e = std::getenv("APICACHE_HOST")) config.server.host = e;
        if (const char* e = std::getenv("APICACHE_UPSTREAM_URL")) config.upstream.base_url = e;
        if (const char* e = std::getenv("APICACHE_VALKEY_HOST")) config.valkey.host = e;
        if (const char* e = std::getenv("APICACHE_VALKEY_PORT")) config.valkey.port = std::stoi(e);
        if (const char* e = std::getenv("APICACHE_VALKEY_PASSWORD")) config.valkey.password = e;
        if (const char* e = std::getenv("APICACHE_LOG_LEVEL")) config.logging.level = e;
        if (const char* e = std::getenv("APICACHE_ADMIN_TOKEN")) config.admin_token = e;
    } catch (const std::logic_error& e) {
        // std::stoi / std::stol failures
        throw ConfigError(std::string("invalid numeric environment override: ") + e.what());
    }
}

void ConfigLoader::validate(const ServerConfig& config) {
    if (config.server.port == 0) {
        throw ConfigError("invalid server port: 0");
    }
    if (!valid_port(config.valkey.port)) {
        throw ConfigError("invalid valkey port: " + std::to_string(config.valkey.port));
    }
    const std::string& url = config.upstream.base_url;
    if (url.empty()) {
        throw ConfigError("upstream base_url is required");
    }
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigError("upstream base_url must be an absolute URL: " + url);
    }
    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        throw ConfigError("upstream base_url scheme must be http or https: " + url);
    }
    if (url.size() == scheme_end + 3 || url[scheme_end + 3] == '/') {
        throw ConfigError("upstream base_url has no host: " + url);
    }
    if (config.upstream.max_idle_conns < 0) {
        throw ConfigError("upstream.max_idle_conns must not be negative");
    }
    if (config.upstream.max_conns_per_host < 0) {
        throw ConfigError("upstream.max_conns_per_host must not be negative");
    }
    if (config.cache.default_ttl.count() <= 0) {
        throw ConfigError("cache.default_ttl must be positive");
    }
    if (config.retry.enabled && config.retry.backoff_multiplier < 1.0) {
        throw ConfigError("retry.backoff_multiplier must be >= 1");
    }
}

Duration ConfigLoader::parse_duration(const std::string& text) {
    if (text.empty()) throw ConfigError("empty duration");
    if (text == "0") return Duration{0};

    double total_ns = 0.0;
    size_t i = 0;
    while (i < text.size()) {
        size_t start = i;
        while (i < text.size() && (std::isdigit(static_cast<unsigned char>(text[i])) || text[i] == '.')) ++i;
        if (start == i) throw ConfigError("invalid duration: " + text);
        std::string number = text.substr(start, i - start);
        char* end = nullptr;
        double value = std::strtod(number.c_str(), &end);
        if (end != number.c_str() + number.size()) throw ConfigError("invalid duration: " + text);

        size_t unit_start = i;
        while (i < text.size() && std::isalpha(static_cast<unsigned char>(text[i]))) ++i;
        std::string unit = text.substr(unit_start, i - unit_start);

        double scale;
        if (unit == "ns") scale = 1.0;
        else if (unit == "us") scale = 1e3;
        else if (unit == "ms") scale = 1e6;
        else if (unit == "s") scale = 1e9;
        else if (unit == "m") scale = 60e9;
        else if (unit == "h") scale = 3600e9;
        else throw ConfigError("invalid duration unit in: " + text);

        total_ns += value * scale;
    }
    return Duration(static_cast<Duration::rep>(std::llround(total_ns / 1e6)));
}

}
