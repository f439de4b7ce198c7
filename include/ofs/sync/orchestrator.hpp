#pragma once

/**
 * @file orchestrator.hpp
 * @brief Replays pending operations against the remote API
 *
 * One cycle:
 *   Idle -> Draining -> for each pending record (FIFO): Replaying -> Draining -> Idle
 *
 * Every record gets exactly one attempt per cycle; a failure never blocks
 * later records. Conflicts go through the configured ConflictPolicy.
 */

#include "ofs/cache/ttl_cache.hpp"
#include "ofs/core/clock.hpp"
#include "ofs/core/config.hpp"
#include "ofs/core/result.hpp"
#include "ofs/events/event_bus.hpp"
#include "ofs/oplog/operation_log.hpp"
#include "ofs/remote/remote_api.hpp"
#include "ofs/store/local_store.hpp"
#include "ofs/sync/conflict.hpp"
#include "ofs/sync/types.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ofs::sync {

class SyncOrchestrator {
public:
    SyncOrchestrator(oplog::OperationLog& log,
                     cache::TtlCache& cache,
                     store::LocalStore& store,
                     remote::RemoteApi& remote,
                     events::EventBus& bus,
                     SyncConfig config,
                     NetworkConfig network,
                     const Clock& clock = SystemClock::instance());

    /**
     * @brief Connectivity gate consulted before a cycle starts
     *
     * Defaults to always online.
     */
    void set_online_check(std::function<bool()> check);

    /**
     * @brief Drain pending operations once
     *
     * ERRORS:
     * - Offline when the online check reports no network
     * - InvalidState when another cycle is already running
     * - Storage when the pending list cannot be read
     */
    Result<SyncSummary> sync_pending_operations();

    /**
     * @brief Stop the running cycle before its next record
     *
     * The record currently in flight finishes its attempt.
     */
    void request_cancel() noexcept;

    [[nodiscard]] SyncState state() const noexcept { return state_.load(); }
    [[nodiscard]] bool is_running() const noexcept { return running_.load(); }

    Result<std::optional<TimePoint>> last_sync();
    Result<std::vector<oplog::OperationRecord>> failed_operations();

    /// Conflicts left for the user under the manual policy
    Result<std::vector<ConflictRecord>> conflicts();

    /**
     * @brief Settle a manual conflict
     *
     * UseLocal force-applies the local payload, UseRemote discards it,
     * Merge force-applies the merged document. The record ends synced.
     */
    Result<void> resolve_conflict(const std::string& operation_id, ConflictChoice choice);

    /**
     * @brief Map a record onto the remote resource implied by its operation
     */
    static remote::MutationRequest build_request(const oplog::OperationRecord& record, bool force);

private:
    struct ReplayOutcome {
        bool synced = false;
        bool conflict = false;
    };

    ReplayOutcome replay(const oplog::OperationRecord& record);
    ReplayOutcome handle_conflict(const oplog::OperationRecord& record, const Error& error);
    ReplayOutcome apply_forced(const oplog::OperationRecord& record, std::string body, const std::string& note);
    ReplayOutcome keep_for_user(const oplog::OperationRecord& record, const std::string& remote_version,
                                const Error& error);
    ReplayOutcome fail(const oplog::OperationRecord& record, const Error& error, bool count_attempt);
    ReplayOutcome synced(const oplog::OperationRecord& record, std::optional<std::string> note);

    void refresh_cache(const oplog::OperationRecord& record, const std::optional<std::string>& remote_data);
    Result<void> save_conflict(const ConflictRecord& conflict);
    Result<void> finish_cycle(const SyncSummary& summary);
    remote::CallOptions call_options() const { return remote::CallOptions{network_.request_timeout}; }

    oplog::OperationLog& log_;
    cache::TtlCache& cache_;
    store::LocalStore& store_;
    remote::RemoteApi& remote_;
    events::EventBus& bus_;
    SyncConfig config_;
    NetworkConfig network_;
    const Clock& clock_;
    ConflictResolver resolver_;

    std::function<bool()> online_check_;
    std::mutex online_mutex_;

    std::atomic<bool> running_{false};
    std::atomic<bool> cancel_requested_{false};
    std::atomic<SyncState> state_{SyncState::Idle};
};

} // namespace ofs::sync
