/**
 * @file components.hpp
 * @brief Bus subscribers that turn engine events into logs and counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Every lifecycle event is now logged and counted
 */

#pragma once

#include "ofs/events/event_bus.hpp"
#include "ofs/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace ofs::events {

/**
 * @brief Remembers subscriptions so a component can detach on destruction
 */
class Subscriptions {
public:
    explicit Subscriptions(EventBus& bus) : bus_(bus) {}
    ~Subscriptions() { reset(); }

    Subscriptions(const Subscriptions&) = delete;
    Subscriptions& operator=(const Subscriptions&) = delete;

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        size_t id = bus_.subscribe<EventType>(std::move(handler));
        cancels_.push_back([this, id]() { bus_.unsubscribe<EventType>(id); });
    }

    void reset() {
        for (auto& cancel : cancels_) {
            cancel();
        }
        cancels_.clear();
    }

    size_t size() const { return cancels_.size(); }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> cancels_;
};

/**
 * @brief Logger component - one structured log line per lifecycle event
 *
 * Progress ticks are logged at debug level, everything else at info,
 * failures and conflicts at warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subs_(bus) {
        subs_.add<SyncStartedEvent>([](const SyncStartedEvent& e) {
            spdlog::info("[SyncStarted] count={}", e.count);
        });

        subs_.add<SyncCompletedEvent>([](const SyncCompletedEvent& e) {
            spdlog::info("[SyncCompleted] synced={} failed={} conflicts={} cancelled={} duration={}ms",
                         e.synced_count, e.failed_count, e.conflict_count, e.cancelled, e.duration.count());
        });

        subs_.add<OperationQueuedEvent>([](const OperationQueuedEvent& e) {
            spdlog::info("[OperationQueued] id={} op={} entity={}/{}",
                         e.id, oplog::to_string(e.operation), e.entity_type, e.entity_id);
        });

        subs_.add<OperationSyncedEvent>([](const OperationSyncedEvent& e) {
            spdlog::info("[OperationSynced] id={} op={} entity={}{}",
                         e.id, oplog::to_string(e.operation), e.entity_id,
                         e.note ? " note=" + *e.note : std::string());
        });

        subs_.add<OperationFailedEvent>([](const OperationFailedEvent& e) {
            spdlog::warn("[OperationFailed] id={} retries={} exhausted={} error={}",
                         e.id, e.retry_count, e.retries_exhausted, describe(e.error));
        });

        subs_.add<OperationRemovedEvent>([](const OperationRemovedEvent& e) {
            spdlog::info("[OperationRemoved] id={}", e.id);
        });

        subs_.add<ConflictDetectedEvent>([](const ConflictDetectedEvent& e) {
            spdlog::warn("[ConflictDetected] op={} entity={}/{} policy={}",
                         e.operation_id, e.entity_type, e.entity_id, sync::to_string(e.policy));
        });

        subs_.add<ConflictResolvedEvent>([](const ConflictResolvedEvent& e) {
            spdlog::info("[ConflictResolved] op={} choice={}", e.operation_id, static_cast<int>(e.choice));
        });

        subs_.add<StaleDataServedEvent>([](const StaleDataServedEvent& e) {
            spdlog::warn("[StaleDataServed] key={} written_at={} cause={}",
                         e.key, to_epoch_ms(e.written_at), describe(e.cause));
        });

        subs_.add<UploadProgressEvent>([](const UploadProgressEvent& e) {
            spdlog::debug("[UploadProgress] task={} progress={:.1f}% bytes={}/{} speed={:.0f}B/s",
                          e.task_id, e.progress, e.uploaded_bytes, e.total_bytes, e.speed);
        });

        subs_.add<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] task={} file={} bytes={} duration={}ms",
                         e.task_id, e.result.file_id, e.result.size, e.duration.count());
        });

        subs_.add<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::warn("[UploadFailed] task={} error={}", e.task_id, describe(e.error));
        });

        subs_.add<UploadCancelledEvent>([](const UploadCancelledEvent& e) {
            spdlog::info("[UploadCancelled] task={}", e.task_id);
        });

        subs_.add<NetworkStatusChangedEvent>([](const NetworkStatusChangedEvent& e) {
            spdlog::info("[NetworkStatusChanged] online={} was_online={} type={} quality={}",
                         e.status.online, e.was_online, e.status.connection_type,
                         network::to_string(e.status.quality()));
        });
    }

private:
    Subscriptions subs_;
};

/**
 * @brief Metrics component - tracks statistics
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Synced: {}", stats.operations_synced.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sync_cycles{0};
        std::atomic<uint64_t> operations_queued{0};
        std::atomic<uint64_t> operations_synced{0};
        std::atomic<uint64_t> operations_failed{0};
        std::atomic<uint64_t> conflicts_detected{0};
        std::atomic<uint64_t> conflicts_resolved{0};
        std::atomic<uint64_t> stale_reads{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
        std::atomic<uint64_t> uploads_cancelled{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> network_transitions{0};
    };

    explicit MetricsComponent(EventBus& bus) : subs_(bus) {
        subs_.add<SyncCompletedEvent>([this](const SyncCompletedEvent&) {
            stats_.sync_cycles++;
        });

        subs_.add<OperationQueuedEvent>([this](const OperationQueuedEvent&) {
            stats_.operations_queued++;
        });

        subs_.add<OperationSyncedEvent>([this](const OperationSyncedEvent&) {
            stats_.operations_synced++;
        });

        subs_.add<OperationFailedEvent>([this](const OperationFailedEvent&) {
            stats_.operations_failed++;
        });

        subs_.add<ConflictDetectedEvent>([this](const ConflictDetectedEvent&) {
            stats_.conflicts_detected++;
        });

        subs_.add<ConflictResolvedEvent>([this](const ConflictResolvedEvent&) {
            stats_.conflicts_resolved++;
        });

        subs_.add<StaleDataServedEvent>([this](const StaleDataServedEvent&) {
            stats_.stale_reads++;
        });

        subs_.add<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            stats_.uploads_completed++;
            stats_.bytes_uploaded += e.result.size;
        });

        subs_.add<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });

        subs_.add<UploadCancelledEvent>([this](const UploadCancelledEvent&) {
            stats_.uploads_cancelled++;
        });

        subs_.add<NetworkStatusChangedEvent>([this](const NetworkStatusChangedEvent& e) {
            if (e.status.online != e.was_online) {
                stats_.network_transitions++;
            }
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Engine Statistics:");
        spdlog::info("  Sync cycles:        {}", stats_.sync_cycles.load());
        spdlog::info("  Operations queued:  {}", stats_.operations_queued.load());
        spdlog::info("  Operations synced:  {}", stats_.operations_synced.load());
        spdlog::info("  Operations failed:  {}", stats_.operations_failed.load());
        spdlog::info("  Conflicts det.:     {}", stats_.conflicts_detected.load());
        spdlog::info("  Conflicts res.:     {}", stats_.conflicts_resolved.load());
        spdlog::info("  Stale reads:        {}", stats_.stale_reads.load());
        spdlog::info("  Uploads completed:  {}", stats_.uploads_completed.load());
        spdlog::info("  Uploads failed:     {}", stats_.uploads_failed.load());
        spdlog::info("  Uploads cancelled:  {}", stats_.uploads_cancelled.load());
        spdlog::info("  Bytes uploaded:     {}", stats_.bytes_uploaded.load());
        spdlog::info("  Network changes:    {}", stats_.network_transitions.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    Subscriptions subs_;   // Detaches before stats_ goes away
};

} // namespace ofs::events
