#include "ofs/sync/orchestrator.hpp"

#include "ofs/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace ofs::sync {

namespace {

constexpr const char* kLastSyncKey = "last_sync";

class RunningGuard {
public:
    RunningGuard(std::atomic<bool>& running, std::atomic<SyncState>& state)
        : running_(running), state_(state) {}

    ~RunningGuard() {
        state_ = SyncState::Idle;
        running_ = false;
    }

    RunningGuard(const RunningGuard&) = delete;
    RunningGuard& operator=(const RunningGuard&) = delete;

private:
    std::atomic<bool>& running_;
    std::atomic<SyncState>& state_;
};

std::string collection_of(const std::string& entity_type) {
    return "/" + entity_type + "s";
}

} // namespace

SyncOrchestrator::SyncOrchestrator(oplog::OperationLog& log,
                                   cache::TtlCache& cache,
                                   store::LocalStore& store,
                                   remote::RemoteApi& remote,
                                   events::EventBus& bus,
                                   SyncConfig config,
                                   NetworkConfig network,
                                   const Clock& clock)
    : log_(log),
      cache_(cache),
      store_(store),
      remote_(remote),
      bus_(bus),
      config_(std::move(config)),
      network_(std::move(network)),
      clock_(clock),
      online_check_([]() { return true; }) {}

void SyncOrchestrator::set_online_check(std::function<bool()> check) {
    std::lock_guard lock(online_mutex_);
    online_check_ = std::move(check);
}

void SyncOrchestrator::request_cancel() noexcept {
    cancel_requested_ = true;
}

remote::MutationRequest SyncOrchestrator::build_request(const oplog::OperationRecord& record, bool force) {
    remote::MutationRequest request;
    request.operation_id = record.id;
    request.entity_type = record.entity_type;
    request.entity_id = record.entity_id;
    request.body = record.data;
    request.force = force;

    const auto collection = collection_of(record.entity_type);
    switch (record.operation) {
        case oplog::OperationType::CreateDraft:
            request.method = remote::MutationMethod::Post;
            request.resource = collection;
            break;
        case oplog::OperationType::UpdateDraft:
            request.method = remote::MutationMethod::Put;
            request.resource = collection + "/" + record.entity_id;
            break;
        case oplog::OperationType::DeleteDraft:
        case oplog::OperationType::DeleteImage:
            request.method = remote::MutationMethod::Delete;
            request.resource = collection + "/" + record.entity_id;
            break;
        case oplog::OperationType::UploadImage:
            request.method = remote::MutationMethod::Post;
            request.resource = collection + "/" + record.entity_id + "/images";
            break;
        case oplog::OperationType::UpdateSettings:
            request.method = remote::MutationMethod::Post;
            request.resource = "/settings";
            break;
    }
    return request;
}

Result<SyncSummary> SyncOrchestrator::sync_pending_operations() {
    bool online = false;
    {
        std::lock_guard lock(online_mutex_);
        online = online_check_();
    }
    if (!online) {
        return Fail<SyncSummary>(ErrorKind::Offline, "no network connection");
    }

    if (running_.exchange(true)) {
        return Fail<SyncSummary>(ErrorKind::InvalidState, "a sync cycle is already running");
    }
    RunningGuard guard(running_, state_);
    cancel_requested_ = false;
    state_ = SyncState::Draining;

    auto pending = log_.list_pending();
    if (pending.is_error()) {
        spdlog::error("Cannot read pending operations: {}", pending.error().message);
        return Err<SyncSummary>(pending.error());
    }

    SyncSummary summary;
    if (pending.value().empty()) {
        spdlog::debug("No pending operations to sync");
        return Ok(summary);
    }

    const auto started = std::chrono::steady_clock::now();
    spdlog::info("Syncing {} pending operations", pending.value().size());
    bus_.emit(events::SyncStartedEvent{pending.value().size()});

    for (const auto& record : pending.value()) {
        if (cancel_requested_) {
            summary.cancelled = true;
            spdlog::info("Sync cancelled with {} records left",
                         pending.value().size() - summary.synced_count - summary.failed_count);
            break;
        }

        state_ = SyncState::Replaying;
        auto outcome = replay(record);
        state_ = SyncState::Draining;

        if (outcome.synced) {
            summary.synced_count++;
        } else {
            summary.failed_count++;
        }
        if (outcome.conflict) {
            summary.conflict_count++;
        }
    }

    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    auto finished = finish_cycle(summary);
    if (finished.is_error()) {
        spdlog::warn("Post-sync bookkeeping failed: {}", finished.error().message);
    }

    bus_.emit(events::SyncCompletedEvent{summary.synced_count, summary.failed_count, summary.conflict_count,
                                         summary.cancelled, summary.duration});
    spdlog::info("Sync finished: {} synced, {} failed, {} conflicts",
                 summary.synced_count, summary.failed_count, summary.conflict_count);
    return Ok(summary);
}

SyncOrchestrator::ReplayOutcome SyncOrchestrator::replay(const oplog::OperationRecord& record) {
    spdlog::debug("Replaying {} {} {}/{}", record.id, oplog::to_string(record.operation),
                  record.entity_type, record.entity_id);

    auto ack = remote_.mutate(build_request(record, false), call_options());
    if (ack.is_ok()) {
        refresh_cache(record, ack.value().data);
        return synced(record, std::nullopt);
    }

    const auto& error = ack.error();
    switch (error.kind) {
        case ErrorKind::NotFound:
            refresh_cache(record, std::nullopt);
            return synced(record, std::string("entity deleted remotely"));
        case ErrorKind::Conflict:
            return handle_conflict(record, error);
        default:
            return fail(record, error, true);
    }
}

SyncOrchestrator::ReplayOutcome SyncOrchestrator::handle_conflict(const oplog::OperationRecord& record,
                                                                  const Error& error) {
    auto counted = log_.record_attempt_failure(record.id, describe(error));
    if (counted.is_error()) {
        spdlog::error("Cannot record conflict on {}: {}", record.id, counted.error().message);
        return ReplayOutcome{false, true};
    }

    const auto policy = config_.conflict_resolution;
    std::string remote_version;
    if (policy != ConflictPolicy::LocalWins) {
        auto fetched = remote_.fetch_entity(record.entity_type, record.entity_id, call_options());
        if (fetched.is_error()) {
            auto outcome = fail(record, fetched.error(), false);
            outcome.conflict = true;
            return outcome;
        }
        remote_version = std::move(fetched.value());
    }

    spdlog::warn("Conflict on {} ({}/{}), policy {}", record.id, record.entity_type, record.entity_id,
                 to_string(policy));
    bus_.emit(events::ConflictDetectedEvent{record.id, record.entity_type, record.entity_id, policy,
                                            record.data, remote_version});

    ReplayOutcome outcome;
    switch (policy) {
        case ConflictPolicy::LocalWins:
            outcome = apply_forced(record, record.data, "");
            break;

        case ConflictPolicy::RemoteWins: {
            auto cached = cache_.set(cache::entity_key(record.entity_type, record.entity_id), remote_version);
            if (cached.is_error()) {
                spdlog::warn("Cannot cache remote version of {}: {}", record.entity_id, cached.error().message);
            }
            outcome = synced(record, std::string("conflict: remote version kept"));
            break;
        }

        case ConflictPolicy::Merge: {
            auto merged = resolver_.resolve(record.data, remote_version, ConflictPolicy::Merge);
            if (merged.is_error()) {
                spdlog::info("Merge of {} not possible ({}), leaving it for manual resolution",
                             record.id, merged.error().message);
                outcome = keep_for_user(record, remote_version, error);
            } else {
                outcome = apply_forced(record, merged.value().resolved, "conflict: merged");
            }
            break;
        }

        case ConflictPolicy::Manual:
            outcome = keep_for_user(record, remote_version, error);
            break;
    }

    outcome.conflict = true;
    return outcome;
}

SyncOrchestrator::ReplayOutcome SyncOrchestrator::apply_forced(const oplog::OperationRecord& record,
                                                               std::string body,
                                                               const std::string& note) {
    auto request = build_request(record, true);
    request.body = std::move(body);

    auto ack = remote_.mutate(request, call_options());
    if (ack.is_error()) {
        return fail(record, ack.error(), false);
    }
    refresh_cache(record, ack.value().data ? ack.value().data : std::optional<std::string>(request.body));
    return synced(record, note.empty() ? std::nullopt : std::optional<std::string>(note));
}

SyncOrchestrator::ReplayOutcome SyncOrchestrator::keep_for_user(const oplog::OperationRecord& record,
                                                                const std::string& remote_version,
                                                                const Error& error) {
    ConflictRecord conflict{record.id, record.entity_type, record.entity_id, record.data, remote_version,
                            clock_.now()};
    auto saved = save_conflict(conflict);
    if (saved.is_error()) {
        spdlog::error("Cannot persist conflict for {}: {}", record.id, saved.error().message);
    }
    return fail(record, error, false);
}

SyncOrchestrator::ReplayOutcome SyncOrchestrator::fail(const oplog::OperationRecord& record,
                                                       const Error& error,
                                                       bool count_attempt) {
    auto updated = log_.mark_failed(record.id, describe(error), count_attempt);
    if (updated.is_error()) {
        spdlog::error("Cannot mark {} failed: {}", record.id, updated.error().message);
        return ReplayOutcome{false, false};
    }

    const auto retries = updated.value().retry_count;
    const bool exhausted = retries >= config_.max_retries;
    spdlog::warn("Operation {} failed (attempt {}): {}", record.id, retries, describe(error));
    bus_.emit(events::OperationFailedEvent{record.id, error, retries, exhausted});
    return ReplayOutcome{false, false};
}

SyncOrchestrator::ReplayOutcome SyncOrchestrator::synced(const oplog::OperationRecord& record,
                                                         std::optional<std::string> note) {
    auto marked = log_.mark_synced(record.id, note);
    if (marked.is_error()) {
        spdlog::error("Applied {} remotely but cannot mark it synced: {}", record.id, marked.error().message);
        return ReplayOutcome{false, false};
    }
    bus_.emit(events::OperationSyncedEvent{record.id, record.operation, record.entity_id, std::move(note)});
    return ReplayOutcome{true, false};
}

void SyncOrchestrator::refresh_cache(const oplog::OperationRecord& record,
                                     const std::optional<std::string>& remote_data) {
    const auto key = cache::entity_key(record.entity_type, record.entity_id);

    bool replace = remote_data &&
                   (record.operation == oplog::OperationType::CreateDraft ||
                    record.operation == oplog::OperationType::UpdateDraft ||
                    record.operation == oplog::OperationType::UpdateSettings);

    auto r = replace ? cache_.set(key, *remote_data) : cache_.invalidate(key);
    if (r.is_error()) {
        spdlog::warn("Cache refresh for {} failed: {}", key, r.error().message);
    }
}

Result<void> SyncOrchestrator::save_conflict(const ConflictRecord& conflict) {
    auto r = store_.execute(
        "INSERT OR REPLACE INTO conflicts(operation_id, entity_type, entity_id, local_version, remote_version, detected_at) "
        "VALUES(?, ?, ?, ?, ?, ?)",
        {conflict.operation_id, conflict.entity_type, conflict.entity_id, store::Blob{conflict.local_version},
         store::Blob{conflict.remote_version}, to_epoch_ms(conflict.detected_at)});
    if (r.is_error()) {
        return Err<void>(r.error());
    }
    return Ok();
}

Result<void> SyncOrchestrator::finish_cycle(const SyncSummary& summary) {
    auto now = clock_.now();
    auto saved = store_.put_setting(kLastSyncKey, std::to_string(to_epoch_ms(now)));
    if (saved.is_error()) {
        return saved;
    }

    auto purged = log_.purge_synced(now - config_.synced_retention);
    if (purged.is_error()) {
        return Err<void>(purged.error());
    }
    if (summary.cancelled) {
        spdlog::debug("Cycle was cancelled; remaining records stay pending");
    }
    return Ok();
}

Result<std::optional<TimePoint>> SyncOrchestrator::last_sync() {
    auto value = store_.get_setting(kLastSyncKey);
    if (value.is_error()) {
        return Err<std::optional<TimePoint>>(value.error());
    }
    if (!value.value()) {
        return Ok(std::optional<TimePoint>());
    }
    try {
        return Ok(std::optional<TimePoint>(from_epoch_ms(std::stoll(*value.value()))));
    } catch (const std::exception& e) {
        return Fail<std::optional<TimePoint>>(ErrorKind::Storage,
                                              std::string("corrupt last_sync setting: ") + e.what());
    }
}

Result<std::vector<oplog::OperationRecord>> SyncOrchestrator::failed_operations() {
    return log_.list_failed();
}

Result<std::vector<ConflictRecord>> SyncOrchestrator::conflicts() {
    auto rows = store_.query(
        "SELECT operation_id, entity_type, entity_id, local_version, remote_version, detected_at "
        "FROM conflicts ORDER BY detected_at ASC, rowid ASC");
    if (rows.is_error()) {
        return Err<std::vector<ConflictRecord>>(rows.error());
    }

    std::vector<ConflictRecord> result;
    for (const auto& row : rows.value()) {
        ConflictRecord conflict;
        conflict.operation_id = store::as_text(row.at(0));
        conflict.entity_type = store::as_text(row.at(1));
        conflict.entity_id = store::as_text(row.at(2));
        conflict.local_version = store::as_text(row.at(3));
        conflict.remote_version = store::as_text(row.at(4));
        conflict.detected_at = from_epoch_ms(store::as_int(row.at(5)));
        result.push_back(std::move(conflict));
    }
    return Ok(std::move(result));
}

Result<void> SyncOrchestrator::resolve_conflict(const std::string& operation_id, ConflictChoice choice) {
    auto all = conflicts();
    if (all.is_error()) {
        return Err<void>(all.error());
    }
    const ConflictRecord* conflict = nullptr;
    for (const auto& candidate : all.value()) {
        if (candidate.operation_id == operation_id) {
            conflict = &candidate;
            break;
        }
    }
    if (!conflict) {
        return Fail<void>(ErrorKind::NotFound, "no open conflict for operation " + operation_id);
    }

    auto found = log_.get(operation_id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    if (!found.value()) {
        return Fail<void>(ErrorKind::NotFound, "operation " + operation_id + " no longer exists");
    }
    const auto& record = *found.value();

    std::optional<std::string> note;
    if (choice == ConflictChoice::UseRemote) {
        auto cached = cache_.set(cache::entity_key(record.entity_type, record.entity_id), conflict->remote_version);
        if (cached.is_error()) {
            spdlog::warn("Cannot cache remote version of {}: {}", record.entity_id, cached.error().message);
        }
        note = "conflict resolved: remote version kept";
    } else {
        std::string body = record.data;
        if (choice == ConflictChoice::Merge) {
            auto merged = resolver_.resolve(conflict->local_version, conflict->remote_version, ConflictPolicy::Merge);
            if (merged.is_error()) {
                return Err<void>(merged.error());
            }
            body = merged.value().resolved;
            note = "conflict resolved: merged";
        } else {
            note = "conflict resolved: local version kept";
        }

        bool online = false;
        {
            std::lock_guard lock(online_mutex_);
            online = online_check_();
        }
        if (!online) {
            return Fail<void>(ErrorKind::Offline, "no network connection");
        }

        auto request = build_request(record, true);
        request.body = body;
        auto ack = remote_.mutate(request, call_options());
        if (ack.is_error()) {
            return Err<void>(ack.error());
        }
        refresh_cache(record, ack.value().data ? ack.value().data : std::optional<std::string>(body));
    }

    auto marked = log_.mark_synced(operation_id, note);
    if (marked.is_error()) {
        return marked;
    }

    bus_.emit(events::ConflictResolvedEvent{operation_id, choice});
    bus_.emit(events::OperationSyncedEvent{record.id, record.operation, record.entity_id, note});
    return Ok();
}

} // namespace ofs::sync
