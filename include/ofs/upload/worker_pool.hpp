#pragma once

#include "ofs/upload/job_queue.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace ofs::upload {

/**
 * @brief Fixed set of worker threads draining a FIFO job queue
 *
 * Jobs start in submission order; at most `thread_count` run at once.
 *
 * THREAD SAFETY: submit() may be called from any thread, including a job.
 */
class WorkerPool {
public:
    using Job = JobQueue::Job;

    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a job; ignored once stop() has been called
     *
     * RETURNS: false when the pool no longer accepts work
     */
    bool submit(Job job);

    /**
     * @brief Let queued jobs drain, then join every worker
     */
    void stop();

    std::size_t size() const { return workers_.size(); }
    std::size_t busy() const { return busy_.load(); }
    std::size_t queued() const { return queue_.size(); }

private:
    void worker_loop();

    JobQueue queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{true};
    std::atomic<std::size_t> busy_{0};
};

} // namespace ofs::upload
