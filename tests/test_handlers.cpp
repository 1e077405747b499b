#include <gtest/gtest.h>
#include "handlers/admin_auth.hpp"
#include "handlers/admin_handler.hpp"
#include "handlers/health_handler.hpp"
#include "metrics.hpp"
#include <sstream>

using namespace apicache;

namespace {

// Records the last delete issued against it.
class RecordingStore : public CacheStore {
public:
    std::string last_removed;
    std::string last_pattern;
    long long deleted = 0;
    bool fail = false;

    StoreResult get(const std::string&, CachedEntry&) override { return StoreResult::missing(); }
    StoreResult set(const std::string&, const CachedEntry&, Duration) override { return StoreResult::success(); }

    StoreResult remove(const std::string& key) override {
        if (fail) return StoreResult::failure("store down");
        last_removed = key;
        return StoreResult::success(deleted);
    }

    StoreResult remove_matching(const std::string& pattern) override {
        if (fail) return StoreResult::failure("store down");
        last_pattern = pattern;
        return StoreResult::success(deleted);
    }

    bool is_connected() const override { return !fail; }
};

http::request<http::string_body> purge_request(const std::string& target, const std::string& token = "") {
    http::request<http::string_body> req{http::verb::delete_, target, 11};
    if (!token.empty()) req.set("X-Admin-Token", token);
    return req;
}

}

class AdminHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.admin_token = "s3cret";
    }

    ServerConfig config;
    RecordingStore store;
    std::stringstream log_output;
    Logger logger{log_output};
    AdminHandler handler{config, store, logger};
};

TEST_F(AdminHandlerTest, RejectsMissingOrWrongToken) {
    auto res = handler.handle_purge(purge_request("/admin/cache?pattern=*"), "10.0.0.1", "rid");
    EXPECT_EQ(res.result(), http::status::unauthorized);
    EXPECT_EQ(res.body(), "{\"error\":\"unauthorized\"}");

    res = handler.handle_purge(purge_request("/admin/cache?pattern=*", "guess"), "10.0.0.1", "rid");
    EXPECT_EQ(res.result(), http::status::unauthorized);
    EXPECT_TRUE(store.last_pattern.empty());
    EXPECT_NE(log_output.str().find("remote_addr=10.0.0.1"), std::string::npos);
}

TEST_F(AdminHandlerTest, EmptyConfiguredTokenDisablesPurge) {
    config.admin_token.clear();
    auto res = handler.handle_purge(purge_request("/admin/cache?pattern=*", "anything"), "127.0.0.1", "rid");
    EXPECT_EQ(res.result(), http::status::unauthorized);
}

TEST_F(AdminHandlerTest, RequiresPatternOrKey) {
    auto res = handler.handle_purge(purge_request("/admin/cache", "s3cret"), "127.0.0.1", "rid");
    EXPECT_EQ(res.result(), http::status::bad_request);

    res = handler.handle_purge(purge_request("/admin/cache?pattern=", "s3cret"), "127.0.0.1", "rid");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(AdminHandlerTest, PurgesScopedPattern) {
    store.deleted = 7;
    auto res = handler.handle_purge(purge_request("/admin/cache?pattern=*", "s3cret"), "127.0.0.1", "rid");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(store.last_pattern, "cache:*");

    auto body = json::parse(res.body()).as_object();
    EXPECT_EQ(body.at("pattern").as_string(), "cache:*");
    EXPECT_EQ(body.at("status").as_string(), "ok");
    EXPECT_EQ(body.at("deleted").as_int64(), 7);
    EXPECT_EQ(res[http::field::content_type], "application/json");
}

TEST_F(AdminHandlerTest, PurgesSingleKey) {
    store.deleted = 1;
    auto res = handler.handle_purge(purge_request("/admin/cache?key=cache:abc", "s3cret"), "127.0.0.1", "rid");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(store.last_removed, "cache:abc");

    auto body = json::parse(res.body()).as_object();
    EXPECT_EQ(body.at("key").as_string(), "cache:abc");
}

TEST_F(AdminHandlerTest, PatternTakesPrecedenceOverKey) {
    handler.handle_purge(purge_request("/admin/cache?key=one&pattern=two*", "s3cret"), "127.0.0.1", "rid");
    EXPECT_EQ(store.last_pattern, "cache:two*");
    EXPECT_TRUE(store.last_removed.empty());
}

TEST_F(AdminHandlerTest, StoreFailureIs500) {
    store.fail = true;
    auto res = handler.handle_purge(purge_request("/admin/cache?pattern=*", "s3cret"), "127.0.0.1", "rid");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(res.body(), "{\"error\":\"cache purge failed\"}");
}

TEST(AdminScopeTest, AddsPrefixOnce) {
    EXPECT_EQ(AdminHandler::scoped("abc"), "cache:abc");
    EXPECT_EQ(AdminHandler::scoped("cache:abc"), "cache:abc");
    EXPECT_EQ(AdminHandler::scoped("*"), "cache:*");
}

TEST(HealthHandlerTest, HealthBody) {
    HealthHandler handler;
    auto res = handler.handle_health(11);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_EQ(res[http::field::server], "api-cache");

    auto body = json::parse(res.body()).as_object();
    EXPECT_EQ(body.at("status").as_string(), "healthy");
    EXPECT_EQ(body.at("service").as_string(), "api-cache");
}

TEST(HealthHandlerTest, MetricsExposition) {
    auto& metrics = MetricsRegistry::instance();
    metrics.reset();
    metrics.increment_counter(metric::cache_hits_total, 4);

    HealthHandler handler;
    auto res = handler.handle_metrics(11);
    EXPECT_EQ(res[http::field::content_type], "text/plain; version=0.0.4");
    EXPECT_NE(res.body().find("cache_hits_total 4"), std::string::npos);
}

TEST(AdminAuthTest, AdminTokenCheck) {
    ServerConfig config;
    http::request<http::string_body> req{http::verb::get, "/metrics", 11};
    req.set("X-Admin-Token", "s3cret");
    EXPECT_FALSE(verify_admin_token(config, req));

    config.admin_token = "s3cret";
    EXPECT_TRUE(verify_admin_token(config, req));
    req.set("X-Admin-Token", "wrong");
    EXPECT_FALSE(verify_admin_token(config, req));
    req.set("X-Admin-Token", "s3cret-and-more");
    EXPECT_FALSE(verify_admin_token(config, req));
    req.erase("X-Admin-Token");
    EXPECT_FALSE(verify_admin_token(config, req));
}
