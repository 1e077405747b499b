#pragma once

#include <string>
#include <utility>

#include "cached_entry.hpp"
#include "server_config.hpp"

namespace apicache {

enum class StoreStatus {
    ok,
    not_found,
    error
};

struct StoreResult {
    StoreStatus status = StoreStatus::ok;
    std::string error;
    long long deleted = 0;  // keys removed by remove / remove_matching

    bool ok() const { return status == StoreStatus::ok; }

    static StoreResult success(long long deleted = 0) { return {StoreStatus::ok, "", deleted}; }
    static StoreResult missing() { return {StoreStatus::not_found, "", 0}; }
    static StoreResult failure(std::string message) { return {StoreStatus::error, std::move(message), 0}; }
};

// Abstract interface to the shared key-value store holding cached responses.
// The production implementation talks to Valkey / Redis; tests substitute
// an in-memory fake. Implementations must be safe for concurrent callers.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    /**
     * Looks up a cached response.
     * @param key Full cache key including its prefix.
     * @param out Filled only when the result is ok.
     * @return ok, not_found, or error (unreachable store or undecodable entry).
     */
    virtual StoreResult get(const std::string& key, CachedEntry& out) = 0;

    /**
     * Stores a response; the store itself enforces expiry.
     * @param ttl Time-to-live, positive.
     */
    virtual StoreResult set(const std::string& key, const CachedEntry& entry, Duration ttl) = 0;

    virtual StoreResult remove(const std::string& key) = 0;

    // Deletes every key matching a glob pattern such as "cache:*".
    // Individual delete failures are logged and skipped; a failed scan is an error.
    virtual StoreResult remove_matching(const std::string& pattern) = 0;

    virtual bool is_connected() const = 0;
};

}
