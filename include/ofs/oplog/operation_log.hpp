#pragma once

/**
 * @file operation_log.hpp
 * @brief Durable append-only log of mutation intents
 *
 * Producers only append. Status, retry_count and error are changed by the
 * sync orchestrator or by explicit user action (requeue, remove).
 *
 *   append() ──> Pending ──mark_synced()──> Synced (terminal)
 *                  │  ^
 *     mark_failed()│  │requeue()
 *                  v  │
 *                 Failed
 */

#include "ofs/core/clock.hpp"
#include "ofs/core/result.hpp"
#include "ofs/events/event_bus.hpp"
#include "ofs/oplog/types.hpp"
#include "ofs/store/local_store.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ofs::oplog {

class OperationLog {
public:
    /// Frees space in the shared store; returns how many entries were dropped
    using SpaceReclaimer = std::function<Result<std::size_t>()>;

    OperationLog(store::LocalStore& store,
                 events::EventBus& bus,
                 const Clock& clock = SystemClock::instance());

    /**
     * @brief Called once when append() hits the storage quota
     *
     * The insert is retried a single time after the reclaimer succeeds.
     */
    void set_space_reclaimer(SpaceReclaimer reclaimer) { reclaim_ = std::move(reclaimer); }

    /**
     * @brief Record a new pending operation
     *
     * Never touches the network. Emits OperationQueuedEvent.
     */
    Result<OperationRecord> append(OperationType operation,
                                   std::string entity_type,
                                   std::string entity_id,
                                   std::string data);

    /// Pending records in insertion order
    Result<std::vector<OperationRecord>> list_pending();
    Result<std::vector<OperationRecord>> list_failed();
    Result<std::vector<OperationRecord>> list_all();

    Result<std::optional<OperationRecord>> get(const std::string& id);
    Result<std::size_t> pending_count();
    Result<std::size_t> failed_count();

    /**
     * @brief Move a record to Synced
     *
     * `note` records why a record was discarded instead of applied and is
     * kept in the error column. InvalidState if the record is already synced.
     * Any stored conflict for the record is dropped with it.
     */
    Result<void> mark_synced(const std::string& id, std::optional<std::string> note = std::nullopt);

    /**
     * @brief Move a record to Failed with `error`
     *
     * With `count_attempt` the retry counter grows by one; the orchestrator
     * passes false when the attempt was already counted by
     * record_attempt_failure().
     */
    Result<OperationRecord> mark_failed(const std::string& id, const std::string& error, bool count_attempt = true);

    /**
     * @brief Count a failed replay attempt without leaving Pending
     */
    Result<OperationRecord> record_attempt_failure(const std::string& id, const std::string& error);

    /**
     * @brief Failed -> Pending, clears error, keeps retry_count
     */
    Result<void> requeue(const std::string& id);

    /// Deletes the record and its stored conflict, NotFound if absent
    Result<void> remove(const std::string& id);

    /**
     * @brief Delete synced records older than `older_than`
     */
    Result<std::size_t> purge_synced(TimePoint older_than);

private:
    Result<std::vector<OperationRecord>> select(const std::string& where, const std::vector<store::Value>& params);
    Result<OperationRecord> require(const std::string& id);
    Result<std::size_t> count_status(OperationStatus status);
    Result<void> drop_conflict(const std::string& id);

    store::LocalStore& store_;
    events::EventBus& bus_;
    const Clock& clock_;
    SpaceReclaimer reclaim_;
};

} // namespace ofs::oplog
