#include <gtest/gtest.h>
#include "server_config.hpp"
#include "config_loader.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace apicache;
using namespace std::chrono_literals;

namespace {

const char* full_config = R"(
server:
  host: 127.0.0.1
  port: 9090
  read_timeout: 10s
  write_timeout: 1m
  idle_timeout: 2m
  threads: 4
  max_body_size: 2048

valkey:
  host: cache.internal
  port: 6380
  password: hunter2
  db: 2
  max_retries: 5
  pool_size: 20
  socket_timeout: 500ms

cache:
  default_ttl: 10m
  max_ttl: 24h
  endpoints:
    - path: /query
      methods: [GET]
      ttl: 24h
      cache_key_query_params: [function, symbol]
      match_query_params:
        function: [TIME_SERIES_DAILY, TIME_SERIES_WEEKLY]
    - path_regex: "^/api/v1/users/[0-9]+$"
      methods: [GET, HEAD]
      ttl: 1h30m
      cache_key_headers: [Accept-Language]
      match_query_params_regex:
        view: ["^(full|summary)$"]

rate_limit:
  enabled: true
  requests_per_second: 50
  burst: 100
  endpoints:
    - path: /search
      requests_per_second: 5
      burst: 10

retry:
  enabled: true
  max_attempts: 4
  initial_backoff: 250ms
  max_backoff: 5s
  backoff_multiplier: 1.5
  retryable_status_codes: [429, 503]

upstream:
  base_url: https://www.alphavantage.co
  timeout: 15s
  max_idle_conns: 20
  max_conns_per_host: 8

logging:
  level: debug
  format: json
  output: stderr
  redact_query_params: [apikey]

admin_token: s3cret
)";

// Scoped environment variable.
class EnvVar {
public:
    EnvVar(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
    ~EnvVar() { unsetenv(name_); }
private:
    const char* name_;
};

}

TEST(ServerConfigTest, DefaultValues) {
    ServerConfig config;
    EXPECT_EQ(config.server.host, "0.0.0.0");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.valkey.port, 6379);
    EXPECT_EQ(config.cache.default_ttl, Duration(5min));
    EXPECT_TRUE(config.rate_limit.enabled);
    EXPECT_EQ(config.retry.max_attempts, 3);
    EXPECT_EQ(config.retry.retryable_status_codes, (std::vector<int>{502, 503, 504}));
    EXPECT_EQ(config.server.max_body_size, 10u * 1024 * 1024);
    EXPECT_TRUE(config.admin_token.empty());
}

TEST(ConfigLoaderTest, ParsesEverySection) {
    ServerConfig config = ConfigLoader::parse(full_config);

    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.read_timeout, Duration(10s));
    EXPECT_EQ(config.server.write_timeout, Duration(1min));
    EXPECT_EQ(config.server.threads, 4);
    EXPECT_EQ(config.server.max_body_size, 2048u);

    EXPECT_EQ(config.valkey.host, "cache.internal");
    EXPECT_EQ(config.valkey.port, 6380);
    EXPECT_EQ(config.valkey.password, "hunter2");
    EXPECT_EQ(config.valkey.db, 2);
    EXPECT_EQ(config.valkey.max_retries, 5);
    EXPECT_EQ(config.valkey.pool_size, 20);
    EXPECT_EQ(config.valkey.socket_timeout, Duration(500ms));

    EXPECT_EQ(config.cache.default_ttl, Duration(10min));
    EXPECT_EQ(config.cache.max_ttl, Duration(24h));
    ASSERT_EQ(config.cache.endpoints.size(), 2u);
    const auto& query = config.cache.endpoints[0];
    EXPECT_EQ(query.path, "/query");
    EXPECT_EQ(query.ttl, Duration(24h));
    EXPECT_EQ(query.cache_key_query_params, (std::vector<std::string>{"function", "symbol"}));
    EXPECT_EQ(query.match_query_params.at("function").size(), 2u);
    const auto& users = config.cache.endpoints[1];
    EXPECT_EQ(users.path_regex, "^/api/v1/users/[0-9]+$");
    EXPECT_EQ(users.methods, (std::vector<std::string>{"GET", "HEAD"}));
    EXPECT_EQ(users.ttl, Duration(90min));
    EXPECT_EQ(users.cache_key_headers, (std::vector<std::string>{"Accept-Language"}));
    EXPECT_EQ(users.match_query_params_regex.at("view")[0], "^(full|summary)$");

    EXPECT_EQ(config.rate_limit.requests_per_second, 50.0);
    EXPECT_EQ(config.rate_limit.burst, 100);
    ASSERT_EQ(config.rate_limit.endpoints.size(), 1u);
    EXPECT_EQ(config.rate_limit.endpoints[0].burst, 10);

    EXPECT_EQ(config.retry.max_attempts, 4);
    EXPECT_EQ(config.retry.initial_backoff, Duration(250ms));
    EXPECT_EQ(config.retry.max_backoff, Duration(5s));
    EXPECT_DOUBLE_EQ(config.retry.backoff_multiplier, 1.5);
    EXPECT_EQ(config.retry.retryable_status_codes, (std::vector<int>{429, 503}));

    EXPECT_EQ(config.upstream.base_url, "https://www.alphavantage.co");
    EXPECT_EQ(config.upstream.timeout, Duration(15s));
    EXPECT_EQ(config.upstream.max_idle_conns, 20);
    EXPECT_EQ(config.upstream.max_conns_per_host, 8);

    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.format, "json");
    EXPECT_EQ(config.logging.output, "stderr");
    EXPECT_EQ(config.logging.redact_query_params, (std::vector<std::string>{"apikey"}));
    EXPECT_EQ(config.admin_token, "s3cret");

    EXPECT_NO_THROW(ConfigLoader::validate(config));
}

TEST(ConfigLoaderTest, EmptyDocumentKeepsDefaults) {
    ServerConfig config = ConfigLoader::parse("");
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_TRUE(config.cache.endpoints.empty());
}

TEST(ConfigLoaderTest, RejectsMalformedYaml) {
    EXPECT_THROW(ConfigLoader::parse("server: [unclosed"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse("- just\n- a list\n"), ConfigError);
}

TEST(ConfigLoaderTest, RejectsBadValues) {
    EXPECT_THROW(ConfigLoader::parse("server:\n  port: 70000\n"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse("server:\n  port: abc\n"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse("cache:\n  default_ttl: forever\n"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse("cache:\n  endpoints: {path: /x}\n"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse("cache:\n  endpoints:\n    - path: /x\n      match_query_params: [a]\n"),
                 ConfigError);
}

TEST(ConfigLoaderTest, ErrorNamesTheField) {
    try {
        ConfigLoader::parse("retry:\n  initial_backoff: soon\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("retry.initial_backoff"), std::string::npos);
    }
}

TEST(ConfigLoaderTest, ValidateRequiresUpstream) {
    ServerConfig config;
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);

    config.upstream.base_url = "www.example.com";
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);

    config.upstream.base_url = "ftp://example.com";
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);

    config.upstream.base_url = "http:///path";
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);

    config.upstream.base_url = "http://example.com/base";
    EXPECT_NO_THROW(ConfigLoader::validate(config));
}

TEST(ConfigLoaderTest, ValidateChecksPortsAndTtl) {
    ServerConfig config;
    config.upstream.base_url = "http://example.com";

    config.valkey.port = 0;
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);
    config.valkey.port = 6379;

    config.cache.default_ttl = Duration{0};
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);
}

TEST(ConfigLoaderTest, ValidateChecksConnectionLimits) {
    ServerConfig config;
    config.upstream.base_url = "http://example.com";
    EXPECT_EQ(config.upstream.max_idle_conns, 100);
    EXPECT_EQ(config.upstream.max_conns_per_host, 0);

    config.upstream.max_idle_conns = 0;
    config.upstream.max_conns_per_host = 0;
    EXPECT_NO_THROW(ConfigLoader::validate(config));

    config.upstream.max_idle_conns = -1;
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);
    config.upstream.max_idle_conns = 10;

    config.upstream.max_conns_per_host = -5;
    EXPECT_THROW(ConfigLoader::validate(config), ConfigError);

    EXPECT_THROW(ConfigLoader::parse("upstream:\n  max_conns_per_host: many\n"), ConfigError);
}

TEST(ConfigLoaderTest, ParseDuration) {
    EXPECT_EQ(ConfigLoader::parse_duration("0"), Duration{0});
    EXPECT_EQ(ConfigLoader::parse_duration("300ms"), Duration(300ms));
    EXPECT_EQ(ConfigLoader::parse_duration("5s"), Duration(5s));
    EXPECT_EQ(ConfigLoader::parse_duration("1.5s"), Duration(1500ms));
    EXPECT_EQ(ConfigLoader::parse_duration("1h30m"), Duration(90min));
    EXPECT_EQ(ConfigLoader::parse_duration("24h"), Duration(24h));

    EXPECT_THROW(ConfigLoader::parse_duration(""), ConfigError);
    EXPECT_THROW(ConfigLoader::parse_duration("10"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse_duration("10d"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse_duration("ms"), ConfigError);
}

TEST(ConfigLoaderTest, ParseDurationRejectsMalformedNumbers) {
    EXPECT_THROW(ConfigLoader::parse_duration("1.2.3s"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse_duration(".s"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse_duration("1..5s"), ConfigError);
    EXPECT_THROW(ConfigLoader::parse_duration("5s1.2.3ms"), ConfigError);
    EXPECT_EQ(ConfigLoader::parse_duration(".5s"), Duration(500ms));
    EXPECT_EQ(ConfigLoader::parse_duration("2.s"), Duration(2s));
}

TEST(ConfigLoaderTest, EnvironmentOverrides) {
    ServerConfig config = ConfigLoader::parse(full_config);
    {
        EnvVar port("APICACHE_PORT", "7000");
        EnvVar upstream("APICACHE_UPSTREAM_URL", "http://localhost:9999");
        EnvVar token("APICACHE_ADMIN_TOKEN", "from-env");
        ConfigLoader::apply_environment(config);
    }
    EXPECT_EQ(config.server.port, 7000);
    EXPECT_EQ(config.upstream.base_url, "http://localhost:9999");
    EXPECT_EQ(config.admin_token, "from-env");
    EXPECT_EQ(config.valkey.host, "cache.internal");
}

TEST(ConfigLoaderTest, InvalidEnvironmentOverride) {
    ServerConfig config;
    EnvVar port("APICACHE_VALKEY_PORT", "not-a-number");
    EXPECT_THROW(ConfigLoader::apply_environment(config), ConfigError);
}

TEST(ConfigLoaderTest, LoadReadsFile) {
    std::string path = ::testing::TempDir() + "apicache_config_test.yaml";
    {
        std::ofstream out(path);
        out << full_config;
    }
    ServerConfig config = ConfigLoader::load(path);
    EXPECT_EQ(config.upstream.base_url, "https://www.alphavantage.co");
    std::remove(path.c_str());

    EXPECT_THROW(ConfigLoader::load("/nonexistent/apicache.yaml"), ConfigError);
}
