#include "ofs/upload/upload_manager.hpp"

#include "ofs/core/ids.hpp"
#include "ofs/upload/validation.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <set>
#include <thread>

namespace ofs::upload {

using json = nlohmann::json;

namespace {

constexpr const char* kStatsKey = "upload_stats";

class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    std::function<void()> fn_;
};

std::uint64_t chunk_length(const ChunkInfo& info, std::uint64_t file_size, std::uint32_t index) {
    const auto offset = static_cast<std::uint64_t>(index) * info.chunk_size;
    if (offset >= file_size) {
        return 0;
    }
    return std::min(info.chunk_size, file_size - offset);
}

std::uint64_t stored_bytes(const ChunkInfo& info, std::uint64_t file_size) {
    std::uint64_t total = 0;
    for (auto index : info.uploaded_chunks) {
        total += chunk_length(info, file_size, index);
    }
    return total;
}

json file_info_json(const FileInfo& info) {
    return json{
        {"file_id", info.file_id},
        {"name", info.name},
        {"url", info.url},
        {"size", info.size},
        {"mime_type", info.mime_type}
    };
}

} // namespace

struct UploadManager::TaskState {
    UploadTask task;
    std::shared_ptr<FileSource> source;
    bool chunked = false;
    std::uint64_t chunk_size = 0;
    bool queued = false;                  ///< A pool job for this task is waiting
    std::set<std::uint32_t> in_flight;

    std::atomic<bool> cancel_requested{false};
    std::atomic<bool> pause_requested{false};

    // Speed is measured over the current run only
    std::uint64_t run_start_bytes = 0;
    TimePoint run_started{};
};

UploadManager::UploadManager(remote::RemoteApi& remote,
                             oplog::OperationLog& log,
                             store::LocalStore& store,
                             events::EventBus& bus,
                             UploadConfig config,
                             NetworkConfig network,
                             const Clock& clock)
    : remote_(remote),
      log_(log),
      store_(store),
      bus_(bus),
      config_(std::move(config)),
      network_(std::move(network)),
      clock_(clock),
      limiter_(config_.max_concurrent),
      pool_(config_.max_concurrent) {
    load_stats();
}

UploadManager::~UploadManager() {
    shutdown();
}

// ════════════════════════════════════════════════════════
// Scheduling
// ════════════════════════════════════════════════════════

Result<std::string> UploadManager::enqueue(std::shared_ptr<FileSource> source, UploadOptions options) {
    if (!source) {
        return Fail<std::string>(ErrorKind::Validation, "no file given");
    }
    if (stopping_) {
        return Fail<std::string>(ErrorKind::InvalidState, "upload manager is shut down");
    }

    auto category = validate_file(source->name(), source->size(), source->mime_type());
    if (category.is_error()) {
        spdlog::warn("Rejected upload of {}: {}", source->name(), category.error().message);
        return Err<std::string>(category.error());
    }

    const auto chunk_size = options.chunk_size.value_or(config_.chunk_size);
    if (chunk_size == 0) {
        return Fail<std::string>(ErrorKind::Validation, "chunk size must be positive");
    }

    auto state = std::make_shared<TaskState>();
    auto& task = state->task;
    task.id = generate_id("upload");
    task.file_name = source->name();
    task.file_size = source->size();
    task.mime_type = source->mime_type();
    task.category = category.value();
    task.max_retries = config_.max_retries;
    task.attach_to = options.attach_to;
    task.created_at = clock_.now();
    state->source = std::move(source);
    state->chunked = options.force_chunked || task.file_size > config_.chunk_threshold;
    state->chunk_size = chunk_size;

    const auto id = task.id;
    {
        std::lock_guard lock(mutex_);
        tasks_[id] = state;
        order_.push_back(id);
    }
    spdlog::info("Queued upload {} for {} ({} bytes, {})", id, task.file_name, task.file_size,
                 state->chunked ? "chunked" : "single request");

    if (options.auto_start) {
        auto scheduled = schedule(state);
        if (scheduled.is_error()) {
            return Err<std::string>(scheduled.error());
        }
    }
    return Ok(id);
}

std::vector<Result<std::string>> UploadManager::enqueue_batch(const std::vector<std::shared_ptr<FileSource>>& sources,
                                                              const UploadOptions& options) {
    std::vector<Result<std::string>> results;
    results.reserve(sources.size());
    for (const auto& source : sources) {
        results.push_back(enqueue(source, options));
    }
    return results;
}

Result<void> UploadManager::start_task(const std::string& task_id) {
    auto state = find(task_id);
    if (!state) {
        return Fail<void>(ErrorKind::NotFound, "unknown upload task: " + task_id);
    }
    {
        std::lock_guard lock(mutex_);
        if (state->task.status != UploadStatus::Pending || state->queued) {
            return Fail<void>(ErrorKind::InvalidState, "task " + task_id + " is not waiting to start");
        }
    }
    return schedule(state);
}

Result<void> UploadManager::schedule(const StatePtr& state) {
    const auto id = state->task.id;
    {
        std::lock_guard lock(mutex_);
        state->queued = true;
        ++pending_jobs_;
    }

    if (!pool_.submit([this, id]() { run_task(id); })) {
        {
            std::lock_guard lock(mutex_);
            state->queued = false;
            --pending_jobs_;
        }
        idle_cv_.notify_all();
        return Fail<void>(ErrorKind::InvalidState, "upload manager is shut down");
    }
    return Ok();
}

void UploadManager::job_finished() {
    {
        std::lock_guard lock(mutex_);
        --pending_jobs_;
    }
    idle_cv_.notify_all();
}

void UploadManager::run_task(const std::string& task_id) {
    ScopeExit done([this]() { job_finished(); });

    StatePtr state;
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return;
        }
        state = it->second;
        state->queued = false;

        // Paused, cancelled or already picked up by an earlier job
        if (stopping_ || state->task.status != UploadStatus::Pending) {
            return;
        }
        state->task.status = UploadStatus::Uploading;
        state->run_start_bytes = state->task.uploaded_bytes;
        state->run_started = clock_.now();
    }

    spdlog::info("Uploading {} ({})", state->task.file_name, task_id);
    if (state->chunked) {
        run_chunked(state);
    } else {
        run_whole_file(state);
    }
}

void UploadManager::run_whole_file(const StatePtr& state) {
    const auto& task = state->task;
    auto bytes = state->source->read(0, task.file_size);
    if (bytes.is_error()) {
        fail_task(state, bytes.error());
        return;
    }

    auto cancelled = [state]() { return state->cancel_requested.load(); };
    auto sent = retry_with_backoff<FileInfo>(
        transfer_policy(),
        [&]() -> Result<FileInfo> {
            auto permit = limiter_.acquire(cancelled);
            if (!permit) {
                return Fail<FileInfo>(ErrorKind::Cancelled, "upload cancelled");
            }
            return remote_.upload_file(task.file_name, task.mime_type, bytes.value(), upload_call());
        },
        cancelled,
        [&](std::uint32_t attempt, const Error& error) {
            spdlog::warn("Upload of {} failed (attempt {}): {}", task.file_name, attempt, error.message);
        });

    if (state->cancel_requested) {
        return;
    }
    if (sent.is_error()) {
        fail_task(state, sent.error());
        return;
    }

    // The single request carried every byte
    std::optional<events::UploadProgressEvent> progress;
    {
        std::lock_guard lock(mutex_);
        if (state->task.status == UploadStatus::Uploading) {
            state->task.uploaded_bytes = state->task.file_size;
            progress = refresh_progress(*state);
            progress->progress = 100.0;
        }
    }
    if (progress) {
        bus_.emit(*progress);
    }
    finalize(state, sent.value());
}

void UploadManager::run_chunked(const StatePtr& state) {
    const std::string task_id = state->task.id;
    const std::uint64_t file_size = state->task.file_size;
    auto interrupted = [state]() {
        return state->cancel_requested.load() || state->pause_requested.load();
    };
    auto log_retry = [&task_id](std::uint32_t attempt, const Error& error) {
        spdlog::warn("Upload {} retrying after attempt {}: {}", task_id, attempt, error.message);
    };

    // Each pass uploads whatever is still missing. A pass ends early when a
    // pause is requested; if resume withdraws it before the task settles the
    // next pass picks up the remaining chunks.
    std::optional<ChunkInfo> info;
    while (true) {
        {
            std::lock_guard lock(mutex_);
            info = state->task.chunk_info;
        }
        if (!info) {
            auto opened = retry_with_backoff<ChunkInfo>(
                transfer_policy(), [&]() { return init_chunk_upload(task_id); }, interrupted, log_retry);
            if (opened.is_error()) {
                if (!interrupted()) {
                    fail_task(state, opened.error());
                    return;
                }
                if (settle_interrupted(state)) {
                    return;
                }
                continue;
            }
            info = opened.value();
        }

        std::vector<std::uint32_t> missing;
        for (std::uint32_t index = 0; index < info->total_chunks; ++index) {
            if (!info->uploaded_chunks.count(index)) {
                missing.push_back(index);
            }
        }
        if (missing.empty()) {
            break;
        }

        // Lanes share one cursor over the missing chunks. After the first hard
        // failure no new chunk starts; chunks already in flight finish.
        std::mutex lane_mutex;
        std::size_t cursor = 0;
        std::size_t sent_chunks = 0;
        std::optional<Error> first_error;
        auto record_error = [&](const Error& error) {
            std::lock_guard lock(lane_mutex);
            if (!first_error) {
                first_error = error;
            }
        };

        auto lane = [&]() {
            while (true) {
                std::uint32_t index = 0;
                {
                    std::lock_guard lock(lane_mutex);
                    if (first_error || interrupted() || cursor >= missing.size()) {
                        return;
                    }
                    index = missing[cursor++];
                }

                const auto offset = static_cast<std::uint64_t>(index) * info->chunk_size;
                auto bytes = state->source->read(offset, chunk_length(*info, file_size, index));
                if (bytes.is_error()) {
                    record_error(bytes.error());
                    return;
                }

                auto sent = retry_with_backoff<void>(
                    transfer_policy(),
                    [&]() { return upload_chunk(info->upload_id, index, bytes.value()); },
                    interrupted,
                    log_retry);
                if (sent.is_error()) {
                    if (sent.error().kind != ErrorKind::Cancelled || !interrupted()) {
                        record_error(sent.error());
                    }
                    return;
                }
                std::lock_guard lock(lane_mutex);
                ++sent_chunks;
            }
        };

        const auto lanes = std::clamp<std::size_t>(missing.size(), 1, std::max<std::size_t>(config_.chunk_concurrency_per_file, 1));
        std::vector<std::thread> helpers;
        helpers.reserve(lanes - 1);
        for (std::size_t i = 1; i < lanes; ++i) {
            helpers.emplace_back(lane);
        }
        lane();
        for (auto& helper : helpers) {
            helper.join();
        }

        if (state->cancel_requested) {
            return;
        }
        if (first_error) {
            fail_task(state, *first_error);
            return;
        }
        if (sent_chunks == missing.size()) {
            break;
        }
        if (state->pause_requested && settle_interrupted(state)) {
            return;
        }
    }

    auto cancelled = [state]() { return state->cancel_requested.load(); };
    auto completed = retry_with_backoff<FileInfo>(
        transfer_policy(), [&]() { return complete_chunk_upload(info->upload_id); }, cancelled, log_retry);
    if (completed.is_error() && !state->cancel_requested) {
        fail_task(state, completed.error());
    }
}

bool UploadManager::settle_interrupted(const StatePtr& state) {
    if (state->cancel_requested) {
        return true;  // cancel path already set the status
    }

    double progress = 0.0;
    {
        std::lock_guard lock(mutex_);
        if (state->task.status != UploadStatus::Uploading) {
            return true;
        }
        if (!state->pause_requested) {
            return false;  // resumed before the pause took effect
        }
        state->task.status = UploadStatus::Paused;
        state->task.speed = 0.0;
        state->task.remaining_time.reset();
        progress = state->task.progress;
    }
    idle_cv_.notify_all();
    spdlog::info("Upload {} paused at {:.1f}%", state->task.id, progress);
    return true;
}

// ════════════════════════════════════════════════════════
// Chunk protocol
// ════════════════════════════════════════════════════════

Result<ChunkInfo> UploadManager::init_chunk_upload(const std::string& task_id,
                                                   std::optional<std::uint64_t> chunk_size) {
    auto state = find(task_id);
    if (!state) {
        return Fail<ChunkInfo>(ErrorKind::NotFound, "unknown upload task: " + task_id);
    }

    std::string name;
    std::string mime_type;
    std::uint64_t file_size = 0;
    std::uint64_t size_per_chunk = 0;
    {
        std::lock_guard lock(mutex_);
        if (is_finished(state->task.status)) {
            return Fail<ChunkInfo>(ErrorKind::InvalidState, "task " + task_id + " is already finished");
        }
        if (state->task.chunk_info) {
            return Fail<ChunkInfo>(ErrorKind::InvalidState, "task " + task_id + " already has a chunk session");
        }
        name = state->task.file_name;
        mime_type = state->task.mime_type;
        file_size = state->task.file_size;
        size_per_chunk = chunk_size.value_or(state->chunk_size);
    }
    if (size_per_chunk == 0) {
        return Fail<ChunkInfo>(ErrorKind::Validation, "chunk size must be positive");
    }

    auto session = remote_.init_upload(name, file_size, mime_type, size_per_chunk, request_call());
    if (session.is_error()) {
        return Err<ChunkInfo>(session.error());
    }

    ChunkInfo info;
    info.upload_id = session.value().upload_id;
    info.chunk_size = size_per_chunk;
    info.total_chunks = static_cast<std::uint32_t>((file_size + size_per_chunk - 1) / size_per_chunk);
    if (session.value().total_chunks != 0 && session.value().total_chunks != info.total_chunks) {
        spdlog::warn("Remote expects {} chunks for {}, sending {}", session.value().total_chunks, name,
                     info.total_chunks);
    }

    {
        std::lock_guard lock(mutex_);
        if (is_finished(state->task.status)) {
            return Fail<ChunkInfo>(ErrorKind::Cancelled, "task " + task_id + " finished while opening session");
        }
        state->task.chunk_info = info;
        upload_to_task_[info.upload_id] = task_id;
    }
    spdlog::debug("Opened chunk session {} for {} ({} chunks of {} bytes)", info.upload_id, name,
                  info.total_chunks, info.chunk_size);
    return Ok(info);
}

Result<void> UploadManager::upload_chunk(const std::string& upload_id, std::uint32_t index, const std::string& bytes) {
    auto state = find_by_upload(upload_id);
    if (!state) {
        return Fail<void>(ErrorKind::NotFound, "unknown upload session: " + upload_id);
    }

    {
        std::lock_guard lock(mutex_);
        auto& task = state->task;
        if (is_finished(task.status)) {
            return Fail<void>(ErrorKind::InvalidState, "task " + task.id + " is already finished");
        }
        if (!task.chunk_info) {
            return Fail<void>(ErrorKind::NotFound, "unknown upload session: " + upload_id);
        }
        const auto& info = *task.chunk_info;
        if (index >= info.total_chunks) {
            return Fail<void>(ErrorKind::InvalidState,
                              "chunk " + std::to_string(index) + " out of range (" +
                                  std::to_string(info.total_chunks) + " chunks)");
        }
        if (info.uploaded_chunks.count(index) || state->in_flight.count(index)) {
            return Fail<void>(ErrorKind::InvalidState, "chunk " + std::to_string(index) + " already sent");
        }
        const auto expected = chunk_length(info, task.file_size, index);
        if (bytes.size() != expected) {
            return Fail<void>(ErrorKind::Validation,
                              "chunk " + std::to_string(index) + " should be " + std::to_string(expected) +
                                  " bytes, got " + std::to_string(bytes.size()));
        }
        state->in_flight.insert(index);
    }

    auto permit = limiter_.acquire([state]() { return state->cancel_requested.load(); });
    if (!permit) {
        std::lock_guard lock(mutex_);
        state->in_flight.erase(index);
        return Fail<void>(ErrorKind::Cancelled, "upload cancelled");
    }
    auto sent = remote_.upload_chunk(upload_id, index, bytes, upload_call());
    permit.release();

    events::UploadProgressEvent progress;
    {
        std::lock_guard lock(mutex_);
        state->in_flight.erase(index);
        if (sent.is_error()) {
            return sent;
        }
        if (state->task.chunk_info) {
            state->task.chunk_info->uploaded_chunks.insert(index);
        }
        progress = refresh_progress(*state);
    }
    bus_.emit(progress);
    return Ok();
}

Result<FileInfo> UploadManager::complete_chunk_upload(const std::string& upload_id) {
    auto state = find_by_upload(upload_id);
    if (!state) {
        return Fail<FileInfo>(ErrorKind::NotFound, "unknown upload session: " + upload_id);
    }

    {
        std::lock_guard lock(mutex_);
        const auto& task = state->task;
        if (is_finished(task.status)) {
            return Fail<FileInfo>(ErrorKind::InvalidState, "task " + task.id + " is already finished");
        }
        if (!task.chunk_info) {
            return Fail<FileInfo>(ErrorKind::NotFound, "unknown upload session: " + upload_id);
        }
        const auto& info = *task.chunk_info;
        if (!info.all_present()) {
            return Fail<FileInfo>(ErrorKind::InvalidState,
                                  "only " + std::to_string(info.uploaded_chunks.size()) + " of " +
                                      std::to_string(info.total_chunks) + " chunks uploaded");
        }
    }

    auto merged = remote_.complete_upload(upload_id, upload_call());
    if (merged.is_error()) {
        return merged;
    }
    finalize(state, merged.value());
    return merged;
}

Result<void> UploadManager::cancel_chunk_upload(const std::string& upload_id) {
    auto state = find_by_upload(upload_id);
    if (!state) {
        return Fail<void>(ErrorKind::NotFound, "unknown upload session: " + upload_id);
    }

    auto cancelled = mark_cancelled(state);
    if (cancelled.is_error()) {
        return cancelled;
    }

    auto remote_cancel = remote_.cancel_upload(upload_id, request_call());
    if (remote_cancel.is_error()) {
        spdlog::warn("Remote cancel of session {} failed: {}", upload_id, remote_cancel.error().message);
    }
    return Ok();
}

Result<std::vector<std::uint32_t>> UploadManager::get_uploaded_chunks(const std::string& upload_id) {
    return remote_.list_uploaded_chunks(upload_id, request_call());
}

// ════════════════════════════════════════════════════════
// Task control
// ════════════════════════════════════════════════════════

Result<void> UploadManager::pause_task(const std::string& task_id) {
    auto state = find(task_id);
    if (!state) {
        return Fail<void>(ErrorKind::NotFound, "unknown upload task: " + task_id);
    }

    std::lock_guard lock(mutex_);
    if (!state->chunked) {
        return Fail<void>(ErrorKind::InvalidState, "single-request uploads cannot be paused");
    }
    switch (state->task.status) {
        case UploadStatus::Pending:
            state->task.status = UploadStatus::Paused;
            state->pause_requested = true;
            break;
        case UploadStatus::Uploading:
            state->pause_requested = true;   // Takes effect at the next chunk boundary
            break;
        default:
            return Fail<void>(ErrorKind::InvalidState,
                              std::string("cannot pause a task that is ") + to_string(state->task.status));
    }
    spdlog::info("Pause requested for upload {}", task_id);
    return Ok();
}

Result<void> UploadManager::resume_task(const std::string& task_id) {
    auto state = find(task_id);
    if (!state) {
        return Fail<void>(ErrorKind::NotFound, "unknown upload task: " + task_id);
    }

    std::optional<std::string> upload_id;
    {
        std::lock_guard lock(mutex_);
        if (state->task.status == UploadStatus::Uploading && state->pause_requested) {
            state->pause_requested = false;
            return Ok();
        }
        if (state->task.status != UploadStatus::Paused) {
            return Fail<void>(ErrorKind::InvalidState,
                              std::string("cannot resume a task that is ") + to_string(state->task.status));
        }
        if (state->task.chunk_info) {
            upload_id = state->task.chunk_info->upload_id;
        }
    }

    if (upload_id) {
        auto reconciled = reconcile_chunks(state, *upload_id);
        if (reconciled.is_error()) {
            return reconciled;
        }
    }

    {
        std::lock_guard lock(mutex_);
        if (state->task.status != UploadStatus::Paused) {
            return Fail<void>(ErrorKind::InvalidState, "task " + task_id + " changed state while resuming");
        }
        state->task.status = UploadStatus::Pending;
        state->pause_requested = false;
    }
    spdlog::info("Resuming upload {}", task_id);
    return schedule(state);
}

Result<void> UploadManager::cancel_task(const std::string& task_id) {
    auto state = find(task_id);
    if (!state) {
        return Fail<void>(ErrorKind::NotFound, "unknown upload task: " + task_id);
    }

    std::optional<std::string> upload_id;
    {
        std::lock_guard lock(mutex_);
        if (state->task.chunk_info) {
            upload_id = state->task.chunk_info->upload_id;
        }
    }
    if (upload_id) {
        return cancel_chunk_upload(*upload_id);
    }
    return mark_cancelled(state);
}

Result<void> UploadManager::retry_upload_task(const std::string& task_id) {
    auto state = find(task_id);
    if (!state) {
        return Fail<void>(ErrorKind::NotFound, "unknown upload task: " + task_id);
    }

    std::optional<std::string> upload_id;
    {
        std::lock_guard lock(mutex_);
        const auto& task = state->task;
        if (task.status != UploadStatus::Failed) {
            return Fail<void>(ErrorKind::InvalidState,
                              std::string("cannot retry a task that is ") + to_string(task.status));
        }
        if (task.retry_count >= task.max_retries) {
            return Fail<void>(ErrorKind::InvalidState,
                              "task " + task_id + " used all " + std::to_string(task.max_retries) + " retries");
        }
        if (task.chunk_info) {
            upload_id = task.chunk_info->upload_id;
        }
    }

    if (upload_id) {
        auto reconciled = reconcile_chunks(state, *upload_id);
        if (reconciled.is_error()) {
            spdlog::warn("Could not reconcile chunks of {}: {}", task_id, reconciled.error().message);
        }
    }

    {
        std::lock_guard lock(mutex_);
        auto& task = state->task;
        if (task.status != UploadStatus::Failed) {
            return Fail<void>(ErrorKind::InvalidState, "task " + task_id + " changed state while retrying");
        }
        task.retry_count++;
        task.error.reset();
        task.status = UploadStatus::Pending;
        state->cancel_requested = false;
        state->pause_requested = false;
        if (task.chunk_info) {
            refresh_progress(*state);
        } else {
            task.uploaded_bytes = 0;
            task.progress = 0.0;
        }
        task.speed = 0.0;
        task.remaining_time.reset();
    }
    spdlog::info("Retrying upload {} ({}/{})", task_id, state->task.retry_count, state->task.max_retries);
    return schedule(state);
}

Result<void> UploadManager::reconcile_chunks(const StatePtr& state, const std::string& upload_id) {
    auto stored = remote_.list_uploaded_chunks(upload_id, request_call());
    if (stored.is_error()) {
        if (stored.error().kind != ErrorKind::NotFound) {
            return Err<void>(stored.error());
        }

        // Session expired remotely; start over with a fresh one
        spdlog::warn("Upload session {} no longer exists, restarting {}", upload_id, state->task.file_name);
        std::lock_guard lock(mutex_);
        upload_to_task_.erase(upload_id);
        state->task.chunk_info.reset();
        state->task.uploaded_bytes = 0;
        state->task.progress = 0.0;
        return Ok();
    }

    std::lock_guard lock(mutex_);
    auto& info = state->task.chunk_info;
    if (!info || info->upload_id != upload_id) {
        return Ok();
    }
    info->uploaded_chunks.clear();
    for (auto index : stored.value()) {
        if (index < info->total_chunks) {
            info->uploaded_chunks.insert(index);
        }
    }
    refresh_progress(*state);
    return Ok();
}

std::size_t UploadManager::clear_finished_tasks() {
    std::lock_guard lock(mutex_);
    std::size_t removed = 0;
    for (auto it = order_.begin(); it != order_.end();) {
        auto found = tasks_.find(*it);
        if (found == tasks_.end() || !is_finished(found->second->task.status)) {
            ++it;
            continue;
        }
        if (found->second->task.chunk_info) {
            upload_to_task_.erase(found->second->task.chunk_info->upload_id);
        }
        tasks_.erase(found);
        it = order_.erase(it);
        ++removed;
    }
    return removed;
}

void UploadManager::clear_all_tasks() {
    std::vector<std::string> active;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, state] : tasks_) {
            if (!is_finished(state->task.status)) {
                active.push_back(id);
            }
        }
    }
    for (const auto& id : active) {
        auto cancelled = cancel_task(id);
        if (cancelled.is_error()) {
            spdlog::debug("Skipped cancelling {}: {}", id, cancelled.error().message);
        }
    }

    std::lock_guard lock(mutex_);
    tasks_.clear();
    upload_to_task_.clear();
    order_.clear();
}

// ════════════════════════════════════════════════════════
// Terminal transitions
// ════════════════════════════════════════════════════════

Result<void> UploadManager::mark_cancelled(const StatePtr& state) {
    UploadStats snapshot;
    {
        std::lock_guard lock(mutex_);
        auto& task = state->task;
        if (task.status == UploadStatus::Completed || task.status == UploadStatus::Cancelled) {
            return Fail<void>(ErrorKind::InvalidState,
                              std::string("cannot cancel a task that is ") + to_string(task.status));
        }
        state->cancel_requested = true;
        task.status = UploadStatus::Cancelled;
        task.speed = 0.0;
        task.remaining_time.reset();
        stats_.files_cancelled++;
        snapshot = stats_;
    }
    idle_cv_.notify_all();

    persist_stats(snapshot);
    spdlog::info("Upload {} cancelled", state->task.id);
    bus_.emit(events::UploadCancelledEvent{state->task.id});
    return Ok();
}

void UploadManager::finalize(const StatePtr& state, const FileInfo& info) {
    UploadStats snapshot;
    std::optional<AttachTarget> attach;
    events::UploadCompletedEvent completed;
    {
        std::lock_guard lock(mutex_);
        auto& task = state->task;
        if (is_finished(task.status)) {
            spdlog::warn("Upload {} finished remotely after it was {}", task.id, to_string(task.status));
            return;
        }
        const auto now = clock_.now();
        task.status = UploadStatus::Completed;
        task.result = info;
        task.error.reset();
        task.progress = 100.0;
        task.uploaded_bytes = task.file_size;
        task.remaining_time = Millis{0};
        task.completed_at = now;

        stats_.files_completed++;
        stats_.bytes_uploaded += task.file_size;
        snapshot = stats_;
        attach = task.attach_to;
        completed = events::UploadCompletedEvent{
            task.id, info, std::chrono::duration_cast<std::chrono::milliseconds>(now - task.created_at)};
    }
    idle_cv_.notify_all();

    persist_stats(snapshot);
    if (attach) {
        // File names come from the caller and may not be valid UTF-8
        auto queued = log_.append(oplog::OperationType::UploadImage, attach->entity_type, attach->entity_id,
                                  file_info_json(info).dump(-1, ' ', false, json::error_handler_t::replace));
        if (queued.is_error()) {
            spdlog::error("Could not queue attachment of {} to {}/{}: {}", info.file_id, attach->entity_type,
                          attach->entity_id, queued.error().message);
        }
    }

    spdlog::info("Upload {} completed as {}", completed.task_id, info.file_id);
    bus_.emit(completed);
}

void UploadManager::fail_task(const StatePtr& state, const Error& error) {
    UploadStats snapshot;
    {
        std::lock_guard lock(mutex_);
        auto& task = state->task;
        if (is_finished(task.status)) {
            return;
        }
        task.status = UploadStatus::Failed;
        task.error = error;
        task.speed = 0.0;
        task.remaining_time.reset();
        stats_.files_failed++;
        snapshot = stats_;
    }
    idle_cv_.notify_all();

    persist_stats(snapshot);
    spdlog::error("Upload {} failed: {}", state->task.id, describe(error));
    bus_.emit(events::UploadFailedEvent{state->task.id, error});
}

// ════════════════════════════════════════════════════════
// Queries
// ════════════════════════════════════════════════════════

std::optional<UploadTask> UploadManager::task(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second->task;
}

std::vector<UploadTask> UploadManager::tasks() const {
    std::lock_guard lock(mutex_);
    std::vector<UploadTask> snapshot;
    snapshot.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = tasks_.find(id);
        if (it != tasks_.end()) {
            snapshot.push_back(it->second->task);
        }
    }
    return snapshot;
}

std::size_t UploadManager::active_count() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(), [](const auto& entry) {
        return entry.second->task.status == UploadStatus::Uploading;
    }));
}

UploadStats UploadManager::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

bool UploadManager::wait_idle(Millis timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return pending_jobs_ == 0; });
}

void UploadManager::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, state] : tasks_) {
            if (state->chunked && state->task.status == UploadStatus::Uploading) {
                state->pause_requested = true;
            }
        }
    }
    pool_.stop();
    spdlog::debug("Upload manager stopped");
}

// ════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════

UploadManager::StatePtr UploadManager::find(const std::string& task_id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second;
}

UploadManager::StatePtr UploadManager::find_by_upload(const std::string& upload_id) const {
    std::lock_guard lock(mutex_);
    auto link = upload_to_task_.find(upload_id);
    if (link == upload_to_task_.end()) {
        return nullptr;
    }
    auto it = tasks_.find(link->second);
    if (it == tasks_.end() || !it->second->task.chunk_info) {
        return nullptr;
    }
    return it->second;
}

events::UploadProgressEvent UploadManager::refresh_progress(TaskState& state) const {
    auto& task = state.task;
    if (task.chunk_info) {
        const auto& info = *task.chunk_info;
        task.uploaded_bytes = stored_bytes(info, task.file_size);
        task.progress = info.total_chunks == 0
                            ? 100.0
                            : 100.0 * static_cast<double>(info.uploaded_chunks.size()) / info.total_chunks;
    } else if (task.file_size > 0) {
        task.progress = 100.0 * static_cast<double>(task.uploaded_bytes) / static_cast<double>(task.file_size);
    }

    const double elapsed = std::chrono::duration<double>(clock_.now() - state.run_started).count();
    const auto sent = task.uploaded_bytes > state.run_start_bytes ? task.uploaded_bytes - state.run_start_bytes : 0;
    task.speed = elapsed > 0.0 ? static_cast<double>(sent) / elapsed : 0.0;
    if (task.speed > 0.0) {
        const double remaining = static_cast<double>(task.file_size - task.uploaded_bytes) / task.speed;
        task.remaining_time = Millis{static_cast<std::int64_t>(remaining * 1000.0)};
    } else {
        task.remaining_time.reset();
    }

    return events::UploadProgressEvent{task.id, task.progress, task.uploaded_bytes, task.file_size,
                                       task.speed, task.remaining_time};
}

RetryPolicy UploadManager::transfer_policy() const {
    return RetryPolicy{config_.chunk_attempts, config_.retry_delay, config_.max_retry_delay, 2.0};
}

void UploadManager::load_stats() {
    auto stored = store_.get_setting(kStatsKey);
    if (stored.is_error()) {
        spdlog::warn("Could not load upload statistics: {}", stored.error().message);
        return;
    }
    if (!stored.value()) {
        return;
    }

    try {
        const auto doc = json::parse(*stored.value());
        stats_.files_completed = doc.value("files_completed", std::uint64_t{0});
        stats_.files_failed = doc.value("files_failed", std::uint64_t{0});
        stats_.files_cancelled = doc.value("files_cancelled", std::uint64_t{0});
        stats_.bytes_uploaded = doc.value("bytes_uploaded", std::uint64_t{0});
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring unreadable upload statistics: {}", e.what());
    }
}

void UploadManager::persist_stats(const UploadStats& snapshot) {
    const json doc{
        {"files_completed", snapshot.files_completed},
        {"files_failed", snapshot.files_failed},
        {"files_cancelled", snapshot.files_cancelled},
        {"bytes_uploaded", snapshot.bytes_uploaded}
    };
    auto saved = store_.put_setting(kStatsKey, doc.dump());
    if (saved.is_error()) {
        spdlog::warn("Could not save upload statistics: {}", saved.error().message);
    }
}

} // namespace ofs::upload
