#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace ofs::upload {

/**
 * @brief Unbounded FIFO of upload jobs feeding the worker pool
 *
 * pop() blocks until a job arrives or the queue is closed. Jobs queued before
 * close() are still handed out, so closing lets the backlog drain.
 */
class JobQueue {
public:
    using Job = std::function<void()>;

    JobQueue() = default;
    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // Returns false once the queue is closed.
    bool push(Job job) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            jobs_.push_back(std::move(job));
        }
        ready_.notify_one();
        return true;
    }

    std::optional<Job> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return closed_ || !jobs_.empty(); });
        if (jobs_.empty()) {
            return std::nullopt;
        }
        Job job = std::move(jobs_.front());
        jobs_.pop_front();
        return job;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return jobs_.size();
    }

private:
    std::deque<Job> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;
};

} // namespace ofs::upload
