#pragma once

/**
 * @file config.hpp
 * @brief Engine configuration surface
 *
 * Every recognised option lives here with the default the engine ships with.
 * load_config() overlays a JSON document on top of these defaults, so a config
 * file only needs the keys it wants to change:
 *
 * {
 *   "cache":  { "default_ttl_ms": 600000 },
 *   "sync":   { "conflict_resolution": "remote_wins" },
 *   "upload": { "max_concurrent": 5 }
 * }
 */

#include "ofs/core/clock.hpp"
#include "ofs/core/result.hpp"
#include "ofs/sync/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ofs {

struct StorageConfig {
    std::string database_path = "ofs.db";   ///< ":memory:" keeps everything in-process
};

struct CacheConfig {
    Millis default_ttl{24 * 60 * 60 * 1000};
    std::size_t max_entries = 1000;
    bool sweep_on_initialize = true;
};

struct SyncConfig {
    std::uint32_t max_retries = 3;
    sync::ConflictPolicy conflict_resolution = sync::ConflictPolicy::Manual;
    bool auto_sync = true;
    Millis auto_sync_interval{30'000};
    bool sync_on_reconnect = true;
    Millis reconnect_delay{1000};
    Millis synced_retention{7LL * 24 * 60 * 60 * 1000};
};

struct UploadConfig {
    std::size_t max_concurrent = 3;
    std::size_t chunk_size = 2 * 1024 * 1024;
    std::size_t chunk_threshold = 2 * 1024 * 1024;   ///< Files above this size are chunked
    std::size_t chunk_concurrency_per_file = 3;
    std::uint32_t max_retries = 3;                   ///< Manual retry budget per task
    std::uint32_t chunk_attempts = 3;                ///< Attempts per chunk before the task fails
    Millis retry_delay{1000};
    Millis max_retry_delay{30'000};
};

struct NetworkConfig {
    Millis request_timeout{30'000};
    Millis upload_timeout{300'000};
    Millis polling_interval{30'000};
    bool enable_polling = false;
};

struct OfflineConfig {
    bool enabled = true;
    std::uint64_t max_storage_bytes = 500ULL * 1024 * 1024;
};

struct LoggingConfig {
    std::string level = "info";
    std::optional<std::filesystem::path> file;
    std::string pattern = "%Y-%m-%d %H:%M:%S.%e [%l] %v";
};

struct EngineConfig {
    StorageConfig storage;
    CacheConfig cache;
    SyncConfig sync;
    UploadConfig upload;
    NetworkConfig network;
    OfflineConfig offline;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a JSON file, overlaying defaults
 *
 * Errors: NotFound when the file is missing, Validation for malformed JSON,
 * wrong value types, or out-of-range values.
 */
Result<EngineConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Same as load_config() but from an in-memory JSON document
 */
Result<EngineConfig> parse_config(const std::string& json_text);

/**
 * @brief Render the effective configuration as pretty-printed JSON
 */
std::string config_to_json(const EngineConfig& config);

} // namespace ofs
