#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace ofs::upload {

/**
 * @brief Counting semaphore over in-flight transfers
 *
 * Every chunk transfer and whole-file upload holds one permit for the
 * duration of its remote call, so the manager never has more than
 * `capacity` transfers in flight no matter how many files are active.
 *
 * EXAMPLE:
 * auto permit = limiter.acquire(is_cancelled);
 * if (!permit) return cancelled;
 * remote.upload_chunk(...);   // permit released at scope exit
 */
class TransferLimiter {
public:
    class Permit {
    public:
        Permit() = default;
        explicit Permit(TransferLimiter* owner) : owner_(owner) {}
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        explicit operator bool() const { return owner_ != nullptr; }

        void release() {
            if (owner_) {
                owner_->release();
                owner_ = nullptr;
            }
        }

    private:
        TransferLimiter* owner_ = nullptr;
    };

    explicit TransferLimiter(std::size_t capacity);

    /**
     * @brief Block until a permit is free
     *
     * RETURNS: Empty permit if `cancelled` became true while waiting
     */
    Permit acquire(const std::function<bool()>& cancelled = {});

    std::size_t capacity() const { return capacity_; }
    std::size_t in_flight() const;
    std::size_t peak() const { return peak_.load(); }

private:
    void release();

    const std::size_t capacity_;
    std::size_t in_flight_ = 0;
    std::atomic<std::size_t> peak_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace ofs::upload
