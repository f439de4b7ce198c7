#include "ofs/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace ofs {

using json = nlohmann::json;

namespace {

// Overlay helpers: a key that is absent keeps the default, a key with the
// wrong JSON type is a validation error.
template<typename T>
void read_field(const json& section, const char* key, T& out) {
    if (section.contains(key)) {
        out = section.at(key).get<T>();
    }
}

void read_millis(const json& section, const char* key, Millis& out) {
    if (section.contains(key)) {
        out = Millis(section.at(key).get<std::int64_t>());
    }
}

const json& section_or_empty(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end()) {
        return empty;
    }
    return *it;
}

constexpr const char* kSections[] = {"storage", "cache", "sync", "upload", "network", "offline", "logging"};

Result<void> validate(const EngineConfig& config) {
    if (config.storage.database_path.empty()) {
        return Fail<void>(ErrorKind::Validation, "storage.database_path must not be empty");
    }
    if (config.cache.default_ttl.count() <= 0) {
        return Fail<void>(ErrorKind::Validation, "cache.default_ttl_ms must be positive");
    }
    if (config.cache.max_entries == 0) {
        return Fail<void>(ErrorKind::Validation, "cache.max_entries must be positive");
    }
    if (config.upload.max_concurrent == 0) {
        return Fail<void>(ErrorKind::Validation, "upload.max_concurrent must be at least 1");
    }
    if (config.upload.chunk_size == 0) {
        return Fail<void>(ErrorKind::Validation, "upload.chunk_size must be positive");
    }
    if (config.upload.chunk_concurrency_per_file == 0) {
        return Fail<void>(ErrorKind::Validation, "upload.chunk_concurrency_per_file must be at least 1");
    }
    if (config.upload.chunk_attempts == 0) {
        return Fail<void>(ErrorKind::Validation, "upload.chunk_attempts must be at least 1");
    }
    if (config.sync.auto_sync_interval.count() <= 0 || config.network.polling_interval.count() <= 0) {
        return Fail<void>(ErrorKind::Validation, "intervals must be positive");
    }
    if (config.sync.reconnect_delay.count() < 0) {
        return Fail<void>(ErrorKind::Validation, "sync.reconnect_delay_ms must not be negative");
    }
    return Ok();
}

} // namespace

Result<EngineConfig> parse_config(const std::string& json_text) {
    EngineConfig config;

    try {
        json root = json::parse(json_text);
        if (!root.is_object()) {
            return Fail<EngineConfig>(ErrorKind::Validation, "configuration root must be a JSON object");
        }
        for (const char* name : kSections) {
            if (root.contains(name) && !root.at(name).is_object()) {
                return Fail<EngineConfig>(ErrorKind::Validation,
                                          std::string("section '") + name + "' must be an object");
            }
        }

        const auto& storage = section_or_empty(root, "storage");
        read_field(storage, "database_path", config.storage.database_path);

        const auto& cache = section_or_empty(root, "cache");
        read_millis(cache, "default_ttl_ms", config.cache.default_ttl);
        read_field(cache, "max_entries", config.cache.max_entries);
        read_field(cache, "sweep_on_initialize", config.cache.sweep_on_initialize);

        const auto& sync = section_or_empty(root, "sync");
        read_field(sync, "max_retries", config.sync.max_retries);
        if (sync.contains("conflict_resolution")) {
            auto text = sync.at("conflict_resolution").get<std::string>();
            auto policy = sync::parse_conflict_policy(text);
            if (!policy) {
                return Fail<EngineConfig>(ErrorKind::Validation,
                                          "unknown sync.conflict_resolution '" + text + "'");
            }
            config.sync.conflict_resolution = *policy;
        }
        read_field(sync, "auto_sync", config.sync.auto_sync);
        read_millis(sync, "auto_sync_interval_ms", config.sync.auto_sync_interval);
        read_field(sync, "sync_on_reconnect", config.sync.sync_on_reconnect);
        read_millis(sync, "reconnect_delay_ms", config.sync.reconnect_delay);
        read_millis(sync, "synced_retention_ms", config.sync.synced_retention);

        const auto& upload = section_or_empty(root, "upload");
        read_field(upload, "max_concurrent", config.upload.max_concurrent);
        read_field(upload, "chunk_size", config.upload.chunk_size);
        read_field(upload, "chunk_threshold", config.upload.chunk_threshold);
        read_field(upload, "chunk_concurrency_per_file", config.upload.chunk_concurrency_per_file);
        read_field(upload, "max_retries", config.upload.max_retries);
        read_field(upload, "chunk_attempts", config.upload.chunk_attempts);
        read_millis(upload, "retry_delay_ms", config.upload.retry_delay);
        read_millis(upload, "max_retry_delay_ms", config.upload.max_retry_delay);

        const auto& network = section_or_empty(root, "network");
        read_millis(network, "request_timeout_ms", config.network.request_timeout);
        read_millis(network, "upload_timeout_ms", config.network.upload_timeout);
        read_millis(network, "polling_interval_ms", config.network.polling_interval);
        read_field(network, "enable_polling", config.network.enable_polling);

        const auto& offline = section_or_empty(root, "offline");
        read_field(offline, "enabled", config.offline.enabled);
        read_field(offline, "max_storage_bytes", config.offline.max_storage_bytes);

        const auto& logging = section_or_empty(root, "logging");
        read_field(logging, "level", config.logging.level);
        read_field(logging, "pattern", config.logging.pattern);
        if (logging.contains("file") && !logging.at("file").is_null()) {
            config.logging.file = std::filesystem::path(logging.at("file").get<std::string>());
        }
    } catch (const json::exception& e) {
        return Fail<EngineConfig>(ErrorKind::Validation, std::string("invalid configuration: ") + e.what());
    }

    auto valid = validate(config);
    if (valid.is_error()) {
        return Err<EngineConfig>(valid.error());
    }
    return Ok(std::move(config));
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Fail<EngineConfig>(ErrorKind::NotFound, "cannot open config file " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

std::string config_to_json(const EngineConfig& config) {
    json j;
    j["storage"] = {{"database_path", config.storage.database_path}};
    j["cache"] = {
        {"default_ttl_ms", config.cache.default_ttl.count()},
        {"max_entries", config.cache.max_entries},
        {"sweep_on_initialize", config.cache.sweep_on_initialize},
    };
    j["sync"] = {
        {"max_retries", config.sync.max_retries},
        {"conflict_resolution", sync::to_string(config.sync.conflict_resolution)},
        {"auto_sync", config.sync.auto_sync},
        {"auto_sync_interval_ms", config.sync.auto_sync_interval.count()},
        {"sync_on_reconnect", config.sync.sync_on_reconnect},
        {"reconnect_delay_ms", config.sync.reconnect_delay.count()},
        {"synced_retention_ms", config.sync.synced_retention.count()},
    };
    j["upload"] = {
        {"max_concurrent", config.upload.max_concurrent},
        {"chunk_size", config.upload.chunk_size},
        {"chunk_threshold", config.upload.chunk_threshold},
        {"chunk_concurrency_per_file", config.upload.chunk_concurrency_per_file},
        {"max_retries", config.upload.max_retries},
        {"chunk_attempts", config.upload.chunk_attempts},
        {"retry_delay_ms", config.upload.retry_delay.count()},
        {"max_retry_delay_ms", config.upload.max_retry_delay.count()},
    };
    j["network"] = {
        {"request_timeout_ms", config.network.request_timeout.count()},
        {"upload_timeout_ms", config.network.upload_timeout.count()},
        {"polling_interval_ms", config.network.polling_interval.count()},
        {"enable_polling", config.network.enable_polling},
    };
    j["offline"] = {
        {"enabled", config.offline.enabled},
        {"max_storage_bytes", config.offline.max_storage_bytes},
    };
    j["logging"] = {
        {"level", config.logging.level},
        {"pattern", config.logging.pattern},
        {"file", config.logging.file ? json(config.logging.file->string()) : json(nullptr)},
    };
    return j.dump(2);
}

} // namespace ofs
