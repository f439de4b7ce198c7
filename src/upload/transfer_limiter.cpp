#include "ofs/upload/transfer_limiter.hpp"

#include <algorithm>
#include <chrono>

namespace ofs::upload {

TransferLimiter::TransferLimiter(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

TransferLimiter::Permit TransferLimiter::acquire(const std::function<bool()>& cancelled) {
    std::unique_lock lock(mutex_);
    while (in_flight_ >= capacity_) {
        if (cancelled && cancelled()) {
            return Permit();
        }
        // Cancellation is polled, nobody notifies for it
        cv_.wait_for(lock, std::chrono::milliseconds(20));
    }
    if (cancelled && cancelled()) {
        return Permit();
    }

    ++in_flight_;
    if (in_flight_ > peak_.load()) {
        peak_ = in_flight_;
    }
    return Permit(this);
}

std::size_t TransferLimiter::in_flight() const {
    std::lock_guard lock(mutex_);
    return in_flight_;
}

void TransferLimiter::release() {
    {
        std::lock_guard lock(mutex_);
        --in_flight_;
    }
    cv_.notify_one();
}

} // namespace ofs::upload
