#pragma once

/**
 * @file ttl_cache.hpp
 * @brief Two-level response cache with time-based expiry and stale fallback
 *
 * WHAT IT DOES:
 * - Memory map in front of the `cache` table; the table is the record of truth
 * - Plain reads treat expired entries as absent
 * - fetch_with_cache() falls back to an expired entry when the remote call
 *   fails, and reports that the data is stale
 *
 * THREAD SAFETY:
 * - All methods may be called concurrently
 * - Same-key writes are last-write-wins
 */

#include "ofs/core/clock.hpp"
#include "ofs/core/config.hpp"
#include "ofs/core/result.hpp"
#include "ofs/core/retry.hpp"
#include "ofs/events/event_bus.hpp"
#include "ofs/store/local_store.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace ofs::cache {

struct CacheEntry {
    std::string key;
    std::string payload;
    TimePoint written_at{};
    std::optional<TimePoint> expires_at;

    bool is_valid(TimePoint now) const { return !expires_at || now < *expires_at; }
};

struct FetchOptions {
    std::optional<Millis> ttl;          ///< Defaults to cache.default_ttl
    bool force_refresh = false;         ///< Skip the cache lookup, always call remote
    bool show_stale_notice = true;      ///< Emit StaleDataServedEvent on fallback
    std::optional<RetryPolicy> retry;   ///< Retry the remote call before falling back
};

struct FetchResult {
    std::string payload;
    bool stale = false;        ///< Served from cache after the remote call failed
    bool from_cache = false;
};

struct CacheStats {
    std::size_t total_items = 0;
    std::size_t memory_items = 0;
    std::optional<TimePoint> oldest;
    std::optional<TimePoint> newest;
};

/**
 * @brief Deterministic cache key for an endpoint and its query parameters
 *
 * `params_json` is re-serialised so key order does not matter:
 * fingerprint("/posts", R"({"page":1,"size":10})") == fingerprint("/posts", R"({"size":10,"page":1})")
 */
std::string fingerprint(const std::string& endpoint, const std::string& params_json = "");

/**
 * @brief Key under which one entity's payload is cached ("draft:42")
 */
std::string entity_key(const std::string& entity_type, const std::string& entity_id);

class TtlCache {
public:
    TtlCache(store::LocalStore& store,
             events::EventBus& bus,
             CacheConfig config,
             const Clock& clock = SystemClock::instance());

    /**
     * @brief Fresh payload for `key`, or nullopt when absent or expired
     */
    std::optional<std::string> get(const std::string& key);

    /**
     * @brief Entry for `key` regardless of expiry
     */
    std::optional<CacheEntry> get_stale(const std::string& key);

    /**
     * @brief Write through to memory and the store
     *
     * A non-positive ttl stores the entry without expiry.
     *
     * ERRORS:
     * - Quota when the store is full even after eviction and one retry
     * Other store failures keep the entry in memory only and succeed.
     */
    Result<void> set(const std::string& key, std::string payload, std::optional<Millis> ttl = std::nullopt);

    /**
     * @brief Read-through fetch with stale fallback
     *
     * 1. Unless force_refresh, return a fresh cached payload
     * 2. Call `remote_call`
     * 3. On success store the result and return it
     * 4. On failure return any cached entry (stale=true), else the error
     */
    Result<FetchResult> fetch_with_cache(const std::function<Result<std::string>()>& remote_call,
                                         const std::string& key,
                                         const FetchOptions& options = {});

    Result<void> invalidate(const std::string& key);
    Result<void> clear();

    /**
     * @brief Delete expired rows; run once at initialization
     *
     * RETURNS: Rows removed
     */
    Result<std::size_t> purge_expired();

    /**
     * @brief Make room in the shared store
     *
     * Purges expired rows, then evicts the oldest tenth of max_entries
     * (at least one), never touching `keep_key`.
     *
     * RETURNS: Entries removed
     */
    Result<std::size_t> reclaim_space(const std::string& keep_key = {});

    Result<CacheStats> stats();
    Result<std::size_t> count_with_prefix(const std::string& prefix);

    /// Stored entries keyed "type:id", counted per type
    Result<std::map<std::string, std::size_t>> count_by_entity_type();

private:
    std::optional<CacheEntry> load(const std::string& key);
    Result<void> write(const CacheEntry& entry);
    Result<void> enforce_capacity(const std::string& keep_key);
    Result<std::size_t> evict_oldest(std::size_t count, const std::string& keep_key);
    void remember(CacheEntry entry);
    void forget(const std::string& key);

    store::LocalStore& store_;
    events::EventBus& bus_;
    CacheConfig config_;
    const Clock& clock_;

    std::unordered_map<std::string, CacheEntry> memory_;
    mutable std::shared_mutex memory_mutex_;
};

} // namespace ofs::cache
