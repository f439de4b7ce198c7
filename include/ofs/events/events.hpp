/**
 * @file events.hpp
 * @brief Lifecycle events published by the offline engine
 *
 * Consumers (UI layer, LoggerComponent, MetricsComponent, tests) subscribe on
 * the EventBus instead of attaching callbacks to individual components.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: SyncStartedEvent, UploadFailedEvent
 */

#pragma once

#include "ofs/core/clock.hpp"
#include "ofs/core/error.hpp"
#include "ofs/network/status.hpp"
#include "ofs/oplog/types.hpp"
#include "ofs/sync/types.hpp"
#include "ofs/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ofs::events {

// ════════════════════════════════════════════════════════
// Sync Events
// ════════════════════════════════════════════════════════

/**
 * @brief A sync cycle picked up `count` pending records
 *
 * WHO EMITS: SyncOrchestrator
 * WHO SUBSCRIBES: Logger, Metrics, UI progress
 */
struct SyncStartedEvent {
    std::size_t count = 0;
};

struct SyncCompletedEvent {
    std::size_t synced_count = 0;
    std::size_t failed_count = 0;
    std::size_t conflict_count = 0;
    bool cancelled = false;
    std::chrono::milliseconds duration{0};
};

// ════════════════════════════════════════════════════════
// Operation Log Events
// ════════════════════════════════════════════════════════

struct OperationQueuedEvent {
    std::string id;
    oplog::OperationType operation = oplog::OperationType::CreateDraft;
    std::string entity_type;
    std::string entity_id;
};

/**
 * @brief A record reached the synced state
 *
 * `note` is set when the record was discarded rather than applied
 * (remote deletion, remote_wins conflict).
 */
struct OperationSyncedEvent {
    std::string id;
    oplog::OperationType operation = oplog::OperationType::CreateDraft;
    std::string entity_id;
    std::optional<std::string> note;
};

struct OperationFailedEvent {
    std::string id;
    Error error;
    std::uint32_t retry_count = 0;
    bool retries_exhausted = false;
};

struct OperationRemovedEvent {
    std::string id;
};

// ════════════════════════════════════════════════════════
// Conflict Events
// ════════════════════════════════════════════════════════

/**
 * @brief A replay hit diverged remote state
 *
 * Emitted for every policy. Under Manual the record is left failed and
 * both versions are available from SyncOrchestrator::conflicts().
 */
struct ConflictDetectedEvent {
    std::string operation_id;
    std::string entity_type;
    std::string entity_id;
    sync::ConflictPolicy policy = sync::ConflictPolicy::Manual;
    std::string local_version;
    std::string remote_version;
};

struct ConflictResolvedEvent {
    std::string operation_id;
    sync::ConflictChoice choice = sync::ConflictChoice::UseLocal;
};

// ════════════════════════════════════════════════════════
// Cache Events
// ════════════════════════════════════════════════════════

/**
 * @brief fetch_with_cache served an entry after the remote call failed
 */
struct StaleDataServedEvent {
    std::string key;
    TimePoint written_at{};
    Error cause;
};

// ════════════════════════════════════════════════════════
// Upload Events
// ════════════════════════════════════════════════════════

struct UploadProgressEvent {
    std::string task_id;
    double progress = 0.0;
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    double speed = 0.0;
    std::optional<Millis> remaining_time;
};

struct UploadCompletedEvent {
    std::string task_id;
    upload::FileInfo result;
    std::chrono::milliseconds duration{0};
};

struct UploadFailedEvent {
    std::string task_id;
    Error error;
};

struct UploadCancelledEvent {
    std::string task_id;
};

// ════════════════════════════════════════════════════════
// Network Events
// ════════════════════════════════════════════════════════

struct NetworkStatusChangedEvent {
    network::NetworkStatus status;
    bool was_online = true;

    bool came_online() const { return status.online && !was_online; }
    bool went_offline() const { return !status.online && was_online; }
};

} // namespace ofs::events
