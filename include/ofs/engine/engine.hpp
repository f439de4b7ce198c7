#pragma once

/**
 * @file engine.hpp
 * @brief Owns and wires every engine component
 *
 * One OfflineEngine per application, constructed at startup and passed by
 * reference to whoever needs it. Components are built in dependency order:
 *
 *   EventBus -> LocalStore -> TtlCache, OperationLog -> SyncOrchestrator,
 *   UploadManager -> NetworkObserver
 *
 * EXAMPLE:
 * LoopbackRemoteApi remote;
 * OfflineEngine engine(load_config("ofs.json").value(), remote);
 * engine.initialize();
 * engine.queue_operation(OperationType::CreateDraft, "draft", "42", R"({"title":"x"})");
 * engine.sync_now();
 * engine.dispose();
 */

#include "ofs/cache/ttl_cache.hpp"
#include "ofs/core/clock.hpp"
#include "ofs/core/config.hpp"
#include "ofs/core/result.hpp"
#include "ofs/events/components.hpp"
#include "ofs/events/event_bus.hpp"
#include "ofs/network/network_observer.hpp"
#include "ofs/oplog/operation_log.hpp"
#include "ofs/remote/remote_api.hpp"
#include "ofs/store/local_store.hpp"
#include "ofs/sync/orchestrator.hpp"
#include "ofs/upload/upload_manager.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ofs {

struct OfflineStatus {
    std::size_t pending_operations = 0;
    std::size_t failed_operations = 0;
    std::map<std::string, std::size_t> cached_items;   ///< By entity type
    std::uint64_t storage_used = 0;
    std::uint64_t storage_quota = 0;
    double storage_percentage = 0.0;
    std::optional<TimePoint> last_sync;
    std::size_t active_uploads = 0;
    bool online = true;
    bool offline_mode = false;   ///< Offline support enabled and no network
};

class OfflineEngine {
public:
    /**
     * @brief Build every component; opens the database
     *
     * Throws std::runtime_error when the database cannot be opened.
     */
    OfflineEngine(EngineConfig config,
                  remote::RemoteApi& remote,
                  const Clock& clock = SystemClock::instance());
    ~OfflineEngine();

    OfflineEngine(const OfflineEngine&) = delete;
    OfflineEngine& operator=(const OfflineEngine&) = delete;

    /**
     * @brief Install logging, apply the storage quota, sweep expired cache
     *        entries and start the network observer
     *
     * Idempotent. InvalidState once dispose() has run: the observer's
     * event loop cannot be restarted, so a disposed engine stays down.
     */
    Result<void> initialize();

    /**
     * @brief Cancel any running sync cycle, stop the observer and wind
     *        down uploads
     *
     * Safe to call more than once; the destructor calls it.
     */
    void dispose();

    bool initialized() const { return initialized_.load(); }

    Result<oplog::OperationRecord> queue_operation(oplog::OperationType operation,
                                                   std::string entity_type,
                                                   std::string entity_id,
                                                   std::string data);

    /// Run one sync cycle on the calling thread
    Result<sync::SyncSummary> sync_now();

    Result<OfflineStatus> offline_status();

    // ── Components ──────────────────────────────────────

    events::EventBus& bus() { return bus_; }
    store::LocalStore& store() { return store_; }
    cache::TtlCache& cache() { return cache_; }
    oplog::OperationLog& operations() { return log_; }
    sync::SyncOrchestrator& sync() { return sync_; }
    upload::UploadManager& uploads() { return uploads_; }
    network::NetworkObserver& network() { return network_; }
    const events::MetricsComponent& metrics() const { return metrics_; }
    const EngineConfig& config() const { return config_; }

private:
    const EngineConfig config_;
    remote::RemoteApi& remote_;
    const Clock& clock_;

    events::EventBus bus_;
    events::MetricsComponent metrics_;
    store::LocalStore store_;
    cache::TtlCache cache_;
    oplog::OperationLog log_;
    sync::SyncOrchestrator sync_;
    upload::UploadManager uploads_;
    network::NetworkObserver network_;
    std::unique_ptr<events::LoggerComponent> logger_;

    std::atomic<bool> initialized_{false};
    bool disposed_ = false;
};

} // namespace ofs
