#include "ofs/engine/engine.hpp"

#include "ofs/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace ofs {

OfflineEngine::OfflineEngine(EngineConfig config, remote::RemoteApi& remote, const Clock& clock)
    : config_(std::move(config)),
      remote_(remote),
      clock_(clock),
      metrics_(bus_),
      store_(config_.storage.database_path),
      cache_(store_, bus_, config_.cache, clock_),
      log_(store_, bus_, clock_),
      sync_(log_, cache_, store_, remote_, bus_, config_.sync, config_.network, clock_),
      uploads_(remote_, log_, store_, bus_, config_.upload, config_.network, clock_),
      network_(bus_, config_.sync, config_.network) {
    // Queued intents outrank cached reads when the store is full
    log_.set_space_reclaimer([this]() { return cache_.reclaim_space(); });
}

OfflineEngine::~OfflineEngine() {
    dispose();
}

Result<void> OfflineEngine::initialize() {
    if (initialized_) {
        return Ok();
    }
    if (disposed_) {
        return Fail<void>(ErrorKind::InvalidState, "engine was disposed, create a new one");
    }

    auto logging = init_logging(config_.logging);
    if (logging.is_error()) {
        return logging;
    }

    if (config_.offline.enabled) {
        auto limited = store_.set_size_limit(config_.offline.max_storage_bytes);
        if (limited.is_error()) {
            spdlog::error("Cannot apply storage quota: {}", limited.error().message);
            return limited;
        }
    }

    if (config_.cache.sweep_on_initialize) {
        auto purged = cache_.purge_expired();
        if (purged.is_error()) {
            spdlog::warn("Expired cache sweep failed: {}", purged.error().message);
        } else if (purged.value() > 0) {
            spdlog::info("Removed {} expired cache entries", purged.value());
        }
    }

    logger_ = std::make_unique<events::LoggerComponent>(bus_);

    sync_.set_online_check([this]() { return network_.is_online(); });
    network_.set_work_pending([this]() {
        auto pending = log_.pending_count();
        return pending.is_ok() && pending.value() > 0;
    });
    network_.set_sync_trigger([this]() {
        if (!initialized_) {
            return;
        }
        auto summary = sync_.sync_pending_operations();
        if (summary.is_error() && summary.error().kind != ErrorKind::Offline &&
            summary.error().kind != ErrorKind::InvalidState) {
            spdlog::warn("Background sync failed: {}", describe(summary.error()));
        }
    });
    initialized_ = true;
    network_.start();

    spdlog::info("Offline engine initialized (database {})", config_.storage.database_path);
    return Ok();
}

void OfflineEngine::dispose() {
    if (!initialized_) {
        return;
    }
    initialized_ = false;
    disposed_ = true;

    // Cancel first: stop() joins the observer thread, which may be mid-cycle
    sync_.request_cancel();
    network_.stop();
    uploads_.shutdown();
    logger_.reset();
    spdlog::info("Offline engine disposed");
}

Result<oplog::OperationRecord> OfflineEngine::queue_operation(oplog::OperationType operation,
                                                              std::string entity_type,
                                                              std::string entity_id,
                                                              std::string data) {
    return log_.append(operation, std::move(entity_type), std::move(entity_id), std::move(data));
}

Result<sync::SyncSummary> OfflineEngine::sync_now() {
    return sync_.sync_pending_operations();
}

Result<OfflineStatus> OfflineEngine::offline_status() {
    OfflineStatus status;

    auto pending = log_.pending_count();
    if (pending.is_error()) {
        return Err<OfflineStatus>(pending.error());
    }
    status.pending_operations = pending.value();

    auto failed = log_.failed_count();
    if (failed.is_error()) {
        return Err<OfflineStatus>(failed.error());
    }
    status.failed_operations = failed.value();

    auto cached = cache_.count_by_entity_type();
    if (cached.is_error()) {
        return Err<OfflineStatus>(cached.error());
    }
    status.cached_items = std::move(cached.value());

    auto used = store_.storage_bytes();
    if (used.is_error()) {
        return Err<OfflineStatus>(used.error());
    }
    status.storage_used = used.value();
    status.storage_quota = config_.offline.max_storage_bytes;
    if (status.storage_quota > 0) {
        status.storage_percentage =
            100.0 * static_cast<double>(status.storage_used) / static_cast<double>(status.storage_quota);
    }

    auto last = sync_.last_sync();
    if (last.is_error()) {
        return Err<OfflineStatus>(last.error());
    }
    status.last_sync = last.value();

    status.active_uploads = uploads_.active_count();
    status.online = network_.is_online();
    status.offline_mode = config_.offline.enabled && !status.online;
    return Ok(std::move(status));
}

} // namespace ofs
