#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <sw/redis++/redis++.h>

#include "cache_store.hpp"
#include "logger.hpp"
#include "server_config.hpp"

namespace apicache {

// Valkey / Redis backed response store.
// Entries are JSON documents written with SET ... PX so that expiry is
// enforced by the server; nothing here tracks freshness.
class RedisCacheStore : public CacheStore {
public:
    RedisCacheStore(const ServerConfig::Valkey& config, Logger& logger);
    ~RedisCacheStore() override = default;

    StoreResult get(const std::string& key, CachedEntry& out) override;
    StoreResult set(const std::string& key, const CachedEntry& entry, Duration ttl) override;
    StoreResult remove(const std::string& key) override;
    StoreResult remove_matching(const std::string& pattern) override;

    // Result of the last PING; set at construction and refreshed by ping().
    bool is_connected() const override { return connected_; }

    bool ping();

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    Logger& logger_;
    int max_retries_;
    std::string address_;
    std::atomic<bool> connected_{false};

    // Re-issues fn after a connection-level failure, up to max_retries_ times.
    // Timeouts are reported at once.
    template <typename Fn>
    auto with_retries(Fn&& fn) -> decltype(fn());
};

}
