#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <map>
#include <chrono>

namespace apicache {

using Duration = std::chrono::milliseconds;

// Caching policy for one endpoint, as written in the configuration file.
// Patterns are kept as text here; EndpointRuleTable compiles them.
struct EndpointCacheConfig {
    std::string path;
    std::string path_regex;
    std::vector<std::string> methods;
    Duration ttl{0};
    std::vector<std::string> cache_key_headers;
    std::vector<std::string> cache_key_query_params;
    std::map<std::string, std::vector<std::string>> match_query_params;
    std::map<std::string, std::vector<std::string>> match_query_params_regex;
};

struct EndpointRateLimitConfig {
    std::string path;
    std::string path_regex;
    double requests_per_second = 0.0;
    int burst = 0;
};


// Process-wide configuration for the caching proxy.
struct ServerConfig {
    // --- Listener ---
    struct Server {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;
        Duration read_timeout = std::chrono::seconds(30);
        Duration write_timeout = std::chrono::seconds(60);  // per-request deadline, 0 disables
        Duration idle_timeout = std::chrono::seconds(120);
        int threads = 0;  // 0 defaults to hardware concurrency
        size_t max_body_size = 10 * 1024 * 1024;  // 10MB
    } server;

    // --- Key-value store (Valkey / Redis) ---
    struct Valkey {
        std::string host = "127.0.0.1";
        int port = 6379;
        std::string password = "";
        int db = 0;
        int max_retries = 3;
        int pool_size = 10;
        Duration socket_timeout = std::chrono::seconds(2);
        Duration connect_timeout = std::chrono::seconds(5);
    } valkey;

    // --- Response caching ---
    struct Cache {
        Duration default_ttl = std::chrono::minutes(5);
        Duration max_ttl{0};  // 0 means uncapped
        std::vector<EndpointCacheConfig> endpoints;
    } cache;

    // --- Per-path token buckets ---
    struct RateLimit {
        bool enabled = true;
        double requests_per_second = 100.0;
        int burst = 200;
        std::vector<EndpointRateLimitConfig> endpoints;
    } rate_limit;

    // --- Upstream retry policy ---
    struct Retry {
        bool enabled = true;
        int max_attempts = 3;
        Duration initial_backoff = std::chrono::milliseconds(100);
        Duration max_backoff = std::chrono::seconds(2);
        double backoff_multiplier = 2.0;
        std::vector<int> retryable_status_codes = {502, 503, 504};
    } retry;

    struct Upstream {
        std::string base_url = "";
        Duration timeout = std::chrono::seconds(30);  // per attempt
        int max_idle_conns = 100;    // 0 = no limit
        int max_conns_per_host = 0;  // 0 = no limit
    } upstream;

    struct Logging {
        std::string level = "info";
        std::string format = "text";
        std::string output = "stdout";
        std::string file_path = "";
        std::vector<std::string> redact_query_params;
    } logging;

    // Required for DELETE /admin/cache; also opens /metrics to non-loopback peers.
    // Empty disables token access.
    std::string admin_token = "";
};

}
