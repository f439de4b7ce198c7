#include "ofs/cache/ttl_cache.hpp"

#include "ofs/events/events.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <vector>

namespace ofs::cache {

using json = nlohmann::json;

std::string fingerprint(const std::string& endpoint, const std::string& params_json) {
    if (params_json.empty()) {
        return endpoint + "_{}";
    }
    // Object keys come back sorted, which makes the dump canonical
    json params = json::parse(params_json, nullptr, false);
    if (params.is_discarded()) {
        return endpoint + "_" + params_json;
    }
    return endpoint + "_" + params.dump();
}

std::string entity_key(const std::string& entity_type, const std::string& entity_id) {
    return entity_type + ":" + entity_id;
}

TtlCache::TtlCache(store::LocalStore& store, events::EventBus& bus, CacheConfig config, const Clock& clock)
    : store_(store),
      bus_(bus),
      config_(std::move(config)),
      clock_(clock) {}

std::optional<std::string> TtlCache::get(const std::string& key) {
    auto now = clock_.now();
    {
        std::shared_lock lock(memory_mutex_);
        auto it = memory_.find(key);
        if (it != memory_.end()) {
            if (it->second.is_valid(now)) {
                return it->second.payload;
            }
            return std::nullopt;
        }
    }

    auto entry = load(key);
    if (!entry || !entry->is_valid(now)) {
        return std::nullopt;
    }
    std::string payload = entry->payload;
    remember(std::move(*entry));
    return payload;
}

std::optional<CacheEntry> TtlCache::get_stale(const std::string& key) {
    {
        std::shared_lock lock(memory_mutex_);
        auto it = memory_.find(key);
        if (it != memory_.end()) {
            return it->second;
        }
    }
    return load(key);
}

Result<void> TtlCache::set(const std::string& key, std::string payload, std::optional<Millis> ttl) {
    CacheEntry entry;
    entry.key = key;
    entry.payload = std::move(payload);
    entry.written_at = clock_.now();
    Millis effective = ttl.value_or(config_.default_ttl);
    if (effective.count() > 0) {
        entry.expires_at = entry.written_at + effective;
    }

    auto written = write(entry);
    if (written.failed_with(ErrorKind::Quota)) {
        spdlog::warn("Cache store full while writing {}, evicting", key);
        auto freed = reclaim_space(key);
        if (freed.is_error()) {
            spdlog::warn("Eviction failed: {}", freed.error().message);
        }
        written = write(entry);
        if (written.failed_with(ErrorKind::Quota)) {
            return written;
        }
    }

    if (written.is_error()) {
        spdlog::warn("Cache entry {} kept in memory only: {}", key, written.error().message);
    } else {
        auto capped = enforce_capacity(key);
        if (capped.is_error()) {
            spdlog::warn("Cache capacity enforcement failed: {}", capped.error().message);
        }
    }

    remember(std::move(entry));
    return Ok();
}

Result<FetchResult> TtlCache::fetch_with_cache(const std::function<Result<std::string>()>& remote_call,
                                               const std::string& key,
                                               const FetchOptions& options) {
    if (!options.force_refresh) {
        if (auto hit = get(key)) {
            spdlog::debug("Cache hit: {}", key);
            return Ok(FetchResult{std::move(*hit), false, true});
        }
    }

    auto remote = options.retry
        ? retry_with_backoff<std::string>(*options.retry, remote_call, {},
              [&key](std::uint32_t attempt, const Error& error) {
                  spdlog::debug("Fetch {} attempt {} failed: {}", key, attempt, error.message);
              })
        : remote_call();

    if (remote.is_ok()) {
        auto stored = set(key, remote.value(), options.ttl);
        if (stored.is_error()) {
            spdlog::warn("Fetched {} but could not cache it: {}", key, stored.error().message);
        }
        return Ok(FetchResult{std::move(remote.value()), false, false});
    }

    auto fallback = get_stale(key);
    if (!fallback) {
        return Err<FetchResult>(remote.error());
    }

    spdlog::warn("Serving cached data for {} after remote failure: {}", key, describe(remote.error()));
    if (options.show_stale_notice) {
        bus_.emit(events::StaleDataServedEvent{key, fallback->written_at, remote.error()});
    }
    return Ok(FetchResult{std::move(fallback->payload), true, true});
}

Result<void> TtlCache::invalidate(const std::string& key) {
    forget(key);
    auto r = store_.execute("DELETE FROM cache WHERE key = ?", {key});
    if (r.is_error()) {
        return Err<void>(r.error());
    }
    return Ok();
}

Result<void> TtlCache::clear() {
    {
        std::unique_lock lock(memory_mutex_);
        memory_.clear();
    }
    auto r = store_.execute("DELETE FROM cache");
    if (r.is_error()) {
        return Err<void>(r.error());
    }
    spdlog::info("Cache cleared ({} rows)", r.value());
    return Ok();
}

Result<std::size_t> TtlCache::purge_expired() {
    auto now = clock_.now();
    {
        std::unique_lock lock(memory_mutex_);
        for (auto it = memory_.begin(); it != memory_.end();) {
            if (it->second.is_valid(now)) {
                ++it;
            } else {
                it = memory_.erase(it);
            }
        }
    }

    auto r = store_.execute("DELETE FROM cache WHERE expires_at IS NOT NULL AND expires_at < ?",
                            {to_epoch_ms(now)});
    if (r.is_error()) {
        return Err<std::size_t>(r.error());
    }
    if (r.value() > 0) {
        spdlog::info("Purged {} expired cache entries", r.value());
    }
    return Ok(static_cast<std::size_t>(r.value()));
}

Result<CacheStats> TtlCache::stats() {
    auto rows = store_.query("SELECT COUNT(*), MIN(timestamp), MAX(timestamp) FROM cache");
    if (rows.is_error()) {
        return Err<CacheStats>(rows.error());
    }

    CacheStats stats;
    const auto& row = rows.value().at(0);
    stats.total_items = static_cast<std::size_t>(store::as_int(row.at(0)));
    if (!store::is_null(row.at(1))) {
        stats.oldest = from_epoch_ms(store::as_int(row.at(1)));
        stats.newest = from_epoch_ms(store::as_int(row.at(2)));
    }
    {
        std::shared_lock lock(memory_mutex_);
        stats.memory_items = memory_.size();
    }
    return Ok(stats);
}

Result<std::size_t> TtlCache::count_with_prefix(const std::string& prefix) {
    auto rows = store_.query("SELECT COUNT(*) FROM cache WHERE substr(key, 1, ?) = ?",
                             {static_cast<std::int64_t>(prefix.size()), prefix});
    if (rows.is_error()) {
        return Err<std::size_t>(rows.error());
    }
    return Ok(static_cast<std::size_t>(store::as_int(rows.value().at(0).at(0))));
}

Result<std::map<std::string, std::size_t>> TtlCache::count_by_entity_type() {
    auto rows = store_.query("SELECT substr(key, 1, instr(key, ':') - 1) AS type, COUNT(*) FROM cache "
                             "WHERE instr(key, ':') > 1 GROUP BY type ORDER BY type",
                             {});
    if (rows.is_error()) {
        return Err<std::map<std::string, std::size_t>>(rows.error());
    }

    std::map<std::string, std::size_t> counts;
    for (const auto& row : rows.value()) {
        counts[store::as_text(row.at(0))] = static_cast<std::size_t>(store::as_int(row.at(1)));
    }
    return Ok(std::move(counts));
}

std::optional<CacheEntry> TtlCache::load(const std::string& key) {
    auto rows = store_.query("SELECT data, timestamp, expires_at FROM cache WHERE key = ?", {key});
    if (rows.is_error()) {
        spdlog::warn("Cache read for {} failed: {}", key, rows.error().message);
        return std::nullopt;
    }
    if (rows.value().empty()) {
        return std::nullopt;
    }

    const auto& row = rows.value().front();
    CacheEntry entry;
    entry.key = key;
    entry.payload = store::as_text(row.at(0));
    entry.written_at = from_epoch_ms(store::as_int(row.at(1)));
    if (!store::is_null(row.at(2))) {
        entry.expires_at = from_epoch_ms(store::as_int(row.at(2)));
    }
    return entry;
}

Result<void> TtlCache::write(const CacheEntry& entry) {
    store::Value expires = entry.expires_at ? store::Value(to_epoch_ms(*entry.expires_at))
                                            : store::Value(std::monostate{});
    auto r = store_.execute(
        "INSERT OR REPLACE INTO cache(key, data, timestamp, expires_at) VALUES(?, ?, ?, ?)",
        {entry.key, store::Blob{entry.payload}, to_epoch_ms(entry.written_at), expires});
    if (r.is_error()) {
        return Err<void>(r.error());
    }
    return Ok();
}

Result<void> TtlCache::enforce_capacity(const std::string& keep_key) {
    auto rows = store_.query("SELECT COUNT(*) FROM cache");
    if (rows.is_error()) {
        return Err<void>(rows.error());
    }
    auto total = static_cast<std::size_t>(store::as_int(rows.value().at(0).at(0)));
    if (total <= config_.max_entries) {
        return Ok();
    }
    auto evicted = evict_oldest(total - config_.max_entries, keep_key);
    if (evicted.is_error()) {
        return Err<void>(evicted.error());
    }
    return Ok();
}

Result<std::size_t> TtlCache::reclaim_space(const std::string& keep_key) {
    std::size_t freed = 0;
    auto purged = purge_expired();
    if (purged.is_error()) {
        spdlog::warn("Expiry sweep during eviction failed: {}", purged.error().message);
    } else {
        freed += purged.value();
    }

    auto evicted = evict_oldest(std::max<std::size_t>(1, config_.max_entries / 10), keep_key);
    if (evicted.is_error()) {
        return evicted;
    }
    return Ok(freed + evicted.value());
}

Result<std::size_t> TtlCache::evict_oldest(std::size_t count, const std::string& keep_key) {
    auto rows = store_.query(
        "SELECT key FROM cache WHERE key <> ? ORDER BY timestamp ASC, rowid ASC LIMIT ?",
        {keep_key, static_cast<std::int64_t>(count)});
    if (rows.is_error()) {
        return Err<std::size_t>(rows.error());
    }

    std::vector<std::string> keys;
    for (const auto& row : rows.value()) {
        keys.push_back(store::as_text(row.at(0)));
    }

    auto tx = store_.transaction([&]() -> Result<void> {
        for (const auto& key : keys) {
            auto r = store_.execute("DELETE FROM cache WHERE key = ?", {key});
            if (r.is_error()) {
                return Err<void>(r.error());
            }
        }
        return Ok();
    });
    if (tx.is_error()) {
        return Err<std::size_t>(tx.error());
    }

    for (const auto& key : keys) {
        forget(key);
    }
    spdlog::debug("Evicted {} cache entries", keys.size());
    return Ok(keys.size());
}

void TtlCache::remember(CacheEntry entry) {
    std::unique_lock lock(memory_mutex_);
    std::string key = entry.key;
    memory_[key] = std::move(entry);

    if (memory_.size() > config_.max_entries) {
        auto oldest = std::min_element(memory_.begin(), memory_.end(), [](const auto& a, const auto& b) {
            return a.second.written_at < b.second.written_at;
        });
        if (oldest != memory_.end() && oldest->first != key) {
            memory_.erase(oldest);
        }
    }
}

void TtlCache::forget(const std::string& key) {
    std::unique_lock lock(memory_mutex_);
    memory_.erase(key);
}

} // namespace ofs::cache
