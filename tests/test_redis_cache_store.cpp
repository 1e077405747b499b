#include <gtest/gtest.h>
#include "redis_cache_store.hpp"
#include "server_config.hpp"
#include <sstream>
#include <thread>
#include <chrono>

using namespace apicache;
using namespace std::chrono_literals;

class RedisCacheStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.socket_timeout = 100ms;
        config.connect_timeout = 200ms;
        config.max_retries = 0;
        store = std::make_unique<RedisCacheStore>(config, logger);

        if (store->is_connected()) {
            store->remove_matching("cache:apicache-test:*");
        }
    }

    void TearDown() override {
        if (store && store->is_connected()) {
            store->remove_matching("cache:apicache-test:*");
        }
    }

    CachedEntry sample_entry() {
        CachedEntry entry;
        entry.status_code = 200;
        entry.headers["Content-Type"] = {"application/json"};
        entry.body = "{\"price\":\"123.45\"}";
        entry.cached_at = std::chrono::system_clock::now();
        return entry;
    }

    ServerConfig::Valkey config;
    std::stringstream log_output;
    Logger logger{log_output, Logger::Level::DEBUG};
    std::unique_ptr<RedisCacheStore> store;
};

TEST_F(RedisCacheStoreTest, ConnectionStatus) {
    if (!store->is_connected()) {
        GTEST_SKIP() << "Valkey not available at 127.0.0.1:6379";
    }
    EXPECT_TRUE(store->ping());
}

TEST_F(RedisCacheStoreTest, SetThenGet) {
    if (!store->is_connected()) GTEST_SKIP();

    auto entry = sample_entry();
    ASSERT_TRUE(store->set("cache:apicache-test:a", entry, 10s).ok());

    CachedEntry loaded;
    auto result = store->get("cache:apicache-test:a", loaded);
    ASSERT_TRUE(result.ok()) << result.error;
    EXPECT_EQ(loaded.status_code, 200);
    EXPECT_EQ(loaded.body, entry.body);
    EXPECT_EQ(loaded.headers, entry.headers);
}

TEST_F(RedisCacheStoreTest, MissingKeyIsNotFound) {
    if (!store->is_connected()) GTEST_SKIP();

    CachedEntry loaded;
    EXPECT_EQ(store->get("cache:apicache-test:absent", loaded).status, StoreStatus::not_found);
}

TEST_F(RedisCacheStoreTest, EntriesExpire) {
    if (!store->is_connected()) GTEST_SKIP();

    ASSERT_TRUE(store->set("cache:apicache-test:short", sample_entry(), 50ms).ok());
    std::this_thread::sleep_for(150ms);

    CachedEntry loaded;
    EXPECT_EQ(store->get("cache:apicache-test:short", loaded).status, StoreStatus::not_found);
}

TEST_F(RedisCacheStoreTest, RejectsNonPositiveTtl) {
    if (!store->is_connected()) GTEST_SKIP();
    EXPECT_EQ(store->set("cache:apicache-test:zero", sample_entry(), 0ms).status, StoreStatus::error);
}

TEST_F(RedisCacheStoreTest, UndecodableEntryIsError) {
    if (!store->is_connected()) GTEST_SKIP();

    sw::redis::Redis raw("tcp://127.0.0.1:6379");
    raw.set("cache:apicache-test:garbage", "not a cached response", 10s);

    CachedEntry loaded;
    auto result = store->get("cache:apicache-test:garbage", loaded);
    EXPECT_EQ(result.status, StoreStatus::error);
    EXPECT_NE(result.error.find("unmarshal"), std::string::npos);
}

TEST_F(RedisCacheStoreTest, RemoveAndRemoveMatching) {
    if (!store->is_connected()) GTEST_SKIP();

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store->set("cache:apicache-test:k" + std::to_string(i), sample_entry(), 10s).ok());
    }

    auto single = store->remove("cache:apicache-test:k0");
    ASSERT_TRUE(single.ok());
    EXPECT_EQ(single.deleted, 1);
    EXPECT_EQ(store->remove("cache:apicache-test:k0").deleted, 0);

    auto bulk = store->remove_matching("cache:apicache-test:k*");
    ASSERT_TRUE(bulk.ok());
    EXPECT_EQ(bulk.deleted, 4);

    CachedEntry loaded;
    EXPECT_EQ(store->get("cache:apicache-test:k3", loaded).status, StoreStatus::not_found);
}

TEST(RedisCacheStoreOfflineTest, UnreachableStoreReportsErrors) {
    ServerConfig::Valkey config;
    config.port = 1;
    config.connect_timeout = 100ms;
    config.socket_timeout = 100ms;
    config.max_retries = 0;
    std::stringstream out;
    Logger logger(out);

    RedisCacheStore store(config, logger);
    EXPECT_FALSE(store.is_connected());

    CachedEntry loaded;
    EXPECT_EQ(store.get("cache:x", loaded).status, StoreStatus::error);
    EXPECT_FALSE(store.set("cache:x", loaded, 1s).ok());
    EXPECT_FALSE(store.remove_matching("cache:*").ok());
    EXPECT_NE(out.str().find("Valkey ping failed"), std::string::npos);
}
