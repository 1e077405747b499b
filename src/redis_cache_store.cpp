#include "redis_cache_store.hpp"

#include <iterator>
#include <vector>

namespace apicache {

RedisCacheStore::RedisCacheStore(const ServerConfig::Valkey& config, Logger& logger)
    : logger_(logger)
    , max_retries_(config.max_retries > 0 ? config.max_retries : 0)
    , address_(config.host + ":" + std::to_string(config.port))
{
    sw::redis::ConnectionOptions options;
    options.host = config.host;
    options.port = config.port;
    options.password = config.password;
    options.db = config.db;
    options.socket_timeout = config.socket_timeout;
    options.connect_timeout = config.connect_timeout;

    sw::redis::ConnectionPoolOptions pool_options;
    pool_options.size = config.pool_size > 0 ? static_cast<std::size_t>(config.pool_size) : 1;

    try {
        redis_ = std::make_unique<sw::redis::Redis>(options, pool_options);
    } catch (const sw::redis::Error& e) {
        logger_.log(Logger::Level::ERROR, Logger::EventType::LIFECYCLE,
                    "Valkey client setup failed", {{"address", address_}, {"error", e.what()}});
        return;
    }

    if (ping()) {
        logger_.log(Logger::Level::INFO, Logger::EventType::LIFECYCLE,
                    "Successfully connected to Valkey", {{"address", address_}});
    }
}

bool RedisCacheStore::ping() {
    if (!redis_) return false;
    try {
        redis_->ping();
        connected_ = true;
    } catch (const sw::redis::Error& e) {
        logger_.log(Logger::Level::ERROR, Logger::EventType::LIFECYCLE,
                    "Valkey ping failed", {{"address", address_}, {"error", e.what()}});
        connected_ = false;
    }
    return connected_;
}

template <typename Fn>
auto RedisCacheStore::with_retries(Fn&& fn) -> decltype(fn()) {
    for (int attempt = 0;; ++attempt) {
        try {
            return fn();
        } catch (const sw::redis::TimeoutError&) {
            throw;
        } catch (const sw::redis::IoError& e) {
            if (attempt >= max_retries_) throw;
            logger_.log(Logger::Level::DEBUG, Logger::EventType::CACHE_ERROR,
                        "Valkey I/O error, retrying command",
                        {{"attempt", std::to_string(attempt + 1)}, {"error", e.what()}});
        }
    }
}

StoreResult RedisCacheStore::get(const std::string& key, CachedEntry& out) {
    if (!redis_) return StoreResult::failure("valkey client not initialized");

    try {
        auto data = with_retries([&] { return redis_->get(key); });
        if (!data) {
            return StoreResult::missing();
        }
        out = CachedEntry::decode(*data);
        return StoreResult::success();
    } catch (const EntryDecodeError& e) {
        logger_.log(Logger::Level::DEBUG, Logger::EventType::CACHE_ERROR,
                    "Stored entry could not be decoded", {{"cache_key", key}, {"error", e.what()}});
        return StoreResult::failure(std::string("failed to unmarshal cached response: ") + e.what());
    } catch (const sw::redis::Error& e) {
        logger_.log(Logger::Level::DEBUG, Logger::EventType::CACHE_ERROR,
                    "Valkey GET failed", {{"cache_key", key}, {"error", e.what()}});
        return StoreResult::failure(std::string("failed to get cache: ") + e.what());
    }
}

StoreResult RedisCacheStore::set(const std::string& key, const CachedEntry& entry, Duration ttl) {
    if (!redis_) return StoreResult::failure("valkey client not initialized");
    if (ttl.count() <= 0) return StoreResult::failure("ttl must be positive");

    std::string data = entry.encode();
    try {
        with_retries([&] { return redis_->set(key, data, ttl); });
        logger_.log(Logger::Level::DEBUG, Logger::EventType::CACHE_STORE,
                    "Cached response", {{"cache_key", key}, {"ttl_ms", std::to_string(ttl.count())}});
        return StoreResult::success();
    } catch (const sw::redis::Error& e) {
        logger_.log(Logger::Level::DEBUG, Logger::EventType::CACHE_ERROR,
                    "Valkey SET failed", {{"cache_key", key}, {"error", e.what()}});
        return StoreResult::failure(std::string("failed to set cache: ") + e.what());
    }
}

StoreResult RedisCacheStore::remove(const std::string& key) {
    if (!redis_) return StoreResult::failure("valkey client not initialized");
    try {
        long long removed = with_retries([&] { return redis_->del(key); });
        return StoreResult::success(removed);
    } catch (const sw::redis::Error& e) {
        return StoreResult::failure(std::string("failed to delete cache: ") + e.what());
    }
}

StoreResult RedisCacheStore::remove_matching(const std::string& pattern) {
    if (!redis_) return StoreResult::failure("valkey client not initialized");

    long long removed = 0;
    try {
        long long cursor = 0;
        do {
            std::vector<std::string> keys;
            cursor = with_retries([&] {
                keys.clear();
                return redis_->scan(cursor, pattern, 100, std::back_inserter(keys));
            });

            for (const auto& key : keys) {
                try {
                    removed += redis_->del(key);
                } catch (const sw::redis::Error& e) {
                    logger_.log(Logger::Level::ERROR, Logger::EventType::CACHE_ERROR,
                                "Failed to delete cache key", {{"key", key}, {"error", e.what()}});
                }
            }
        } while (cursor != 0);
    } catch (const sw::redis::Error& e) {
        return StoreResult::failure(std::string("failed to scan cache: ") + e.what());
    }
    return StoreResult::success(removed);
}

}
