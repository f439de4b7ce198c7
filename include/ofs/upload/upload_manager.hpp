#pragma once

/**
 * @file upload_manager.hpp
 * @brief Queued, resumable file uploads with bounded concurrency
 *
 * WHAT IT DOES:
 * - Validates files against per-category size limits before queueing
 * - Runs at most upload.max_concurrent tasks at once (FIFO start order)
 * - Sends small files in one request, larger ones as fixed-size chunks
 * - Never has more than upload.max_concurrent transfers in flight overall
 * - Retries transient chunk failures with exponential backoff
 * - Supports pause/resume at chunk boundaries and cancellation
 * - Queues an upload_image operation when a file is attached to an entity
 *
 * EXAMPLE:
 * auto source = FileSource::from_path("photo.jpg");
 * auto id = manager.enqueue(source.value(), {AttachTarget{"draft", "42"}});
 * manager.wait_idle(std::chrono::seconds(30));
 *
 * THREAD SAFETY: All public methods may be called from any thread.
 * Events are emitted from worker threads without internal locks held.
 */

#include "ofs/core/clock.hpp"
#include "ofs/core/config.hpp"
#include "ofs/core/result.hpp"
#include "ofs/core/retry.hpp"
#include "ofs/events/event_bus.hpp"
#include "ofs/events/events.hpp"
#include "ofs/oplog/operation_log.hpp"
#include "ofs/remote/remote_api.hpp"
#include "ofs/store/local_store.hpp"
#include "ofs/upload/file_source.hpp"
#include "ofs/upload/transfer_limiter.hpp"
#include "ofs/upload/types.hpp"
#include "ofs/upload/worker_pool.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ofs::upload {

class UploadManager {
public:
    UploadManager(remote::RemoteApi& remote,
                  oplog::OperationLog& log,
                  store::LocalStore& store,
                  events::EventBus& bus,
                  UploadConfig config,
                  NetworkConfig network,
                  const Clock& clock = SystemClock::instance());
    ~UploadManager();

    UploadManager(const UploadManager&) = delete;
    UploadManager& operator=(const UploadManager&) = delete;

    // ── Scheduling ──────────────────────────────────────

    /**
     * @brief Validate and queue one file
     *
     * RETURNS: Task id
     * ERRORS: Validation for unsupported or oversized files,
     *         InvalidState after shutdown()
     */
    Result<std::string> enqueue(std::shared_ptr<FileSource> source, UploadOptions options = {});

    /// One result per source, in order; a rejected file does not stop the rest
    std::vector<Result<std::string>> enqueue_batch(const std::vector<std::shared_ptr<FileSource>>& sources,
                                                   const UploadOptions& options = {});

    /// Schedule a task queued with auto_start = false
    Result<void> start_task(const std::string& task_id);

    // ── Chunk protocol ──────────────────────────────────

    /**
     * @brief Open a remote chunk session for a task
     *
     * total_chunks = ceil(file_size / chunk_size)
     */
    Result<ChunkInfo> init_chunk_upload(const std::string& task_id,
                                        std::optional<std::uint64_t> chunk_size = std::nullopt);

    /**
     * @brief Send one chunk
     *
     * ERRORS:
     * - NotFound for an unknown upload id
     * - InvalidState for an out-of-range index, a chunk already sent or in
     *   flight, or a finished task
     * - Validation when the byte count does not match the chunk's size
     */
    Result<void> upload_chunk(const std::string& upload_id, std::uint32_t index, const std::string& bytes);

    /**
     * @brief Merge the chunks remotely and complete the task
     *
     * Fails with InvalidState and no side effects unless every chunk is present.
     */
    Result<FileInfo> complete_chunk_upload(const std::string& upload_id);

    /// Marks the task cancelled even when the remote cancel fails
    Result<void> cancel_chunk_upload(const std::string& upload_id);

    Result<std::vector<std::uint32_t>> get_uploaded_chunks(const std::string& upload_id);

    // ── Task control ────────────────────────────────────

    Result<void> pause_task(const std::string& task_id);
    Result<void> resume_task(const std::string& task_id);
    Result<void> cancel_task(const std::string& task_id);

    /**
     * @brief Re-queue a failed task
     *
     * Allowed while retry_count < max_retries. Chunks already stored
     * remotely are not sent again.
     */
    Result<void> retry_upload_task(const std::string& task_id);

    /// Drop completed, failed and cancelled tasks; returns how many
    std::size_t clear_finished_tasks();

    /// Cancel everything still active and forget all tasks
    void clear_all_tasks();

    // ── Queries ─────────────────────────────────────────

    std::optional<UploadTask> task(const std::string& task_id) const;
    std::vector<UploadTask> tasks() const;   ///< In enqueue order
    std::size_t active_count() const;        ///< Tasks currently uploading
    UploadStats stats() const;
    std::size_t peak_transfers() const { return limiter_.peak(); }

    /**
     * @brief Block until no scheduled task is queued or running
     *
     * RETURNS: false on timeout
     */
    bool wait_idle(Millis timeout);

    /**
     * @brief Stop accepting work and wind down
     *
     * Chunked uploads in progress pause at their next chunk boundary so
     * they can resume later; queued tasks stay pending.
     */
    void shutdown();

private:
    struct TaskState;
    using StatePtr = std::shared_ptr<TaskState>;

    StatePtr find(const std::string& task_id) const;
    StatePtr find_by_upload(const std::string& upload_id) const;

    Result<void> schedule(const StatePtr& state);
    void run_task(const std::string& task_id);
    void run_whole_file(const StatePtr& state);
    void run_chunked(const StatePtr& state);
    /// Uploading -> Paused; false when resume withdrew the pause first
    bool settle_interrupted(const StatePtr& state);
    void job_finished();

    Result<void> reconcile_chunks(const StatePtr& state, const std::string& upload_id);
    Result<void> mark_cancelled(const StatePtr& state);
    void finalize(const StatePtr& state, const FileInfo& info);
    void fail_task(const StatePtr& state, const Error& error);

    events::UploadProgressEvent refresh_progress(TaskState& state) const;
    void load_stats();
    void persist_stats(const UploadStats& snapshot);

    RetryPolicy transfer_policy() const;
    remote::CallOptions upload_call() const { return remote::CallOptions{network_.upload_timeout}; }
    remote::CallOptions request_call() const { return remote::CallOptions{network_.request_timeout}; }

    remote::RemoteApi& remote_;
    oplog::OperationLog& log_;
    store::LocalStore& store_;
    events::EventBus& bus_;
    const UploadConfig config_;
    const NetworkConfig network_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, StatePtr> tasks_;
    std::unordered_map<std::string, std::string> upload_to_task_;
    std::vector<std::string> order_;
    std::size_t pending_jobs_ = 0;
    UploadStats stats_;

    std::atomic<bool> stopping_{false};
    TransferLimiter limiter_;
    WorkerPool pool_;
};

} // namespace ofs::upload
