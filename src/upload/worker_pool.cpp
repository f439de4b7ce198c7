#include "ofs/upload/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace ofs::upload {

WorkerPool::WorkerPool(std::size_t thread_count) {
    thread_count = std::max<std::size_t>(thread_count, 1);
    workers_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
    spdlog::debug("Worker pool started with {} threads", thread_count);
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(Job job) {
    if (!running_.load(std::memory_order_acquire)) {
        return false;
    }
    return queue_.push(std::move(job));
}

void WorkerPool::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queue_.close();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    spdlog::debug("Worker pool stopped");
}

void WorkerPool::worker_loop() {
    while (true) {
        auto job = queue_.pop();
        if (!job) {
            break;  // Closed and drained
        }

        busy_.fetch_add(1, std::memory_order_relaxed);
        try {
            (*job)();
        } catch (const std::exception& e) {
            spdlog::error("Upload job threw: {}", e.what());
        }
        busy_.fetch_sub(1, std::memory_order_relaxed);
    }
}

} // namespace ofs::upload
