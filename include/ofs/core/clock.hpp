#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace ofs {

using TimePoint = std::chrono::system_clock::time_point;
using Millis = std::chrono::milliseconds;

inline std::int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<Millis>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(Millis(ms)));
}

/**
 * @brief Wall-clock source used for expiry, retention and transfer rates
 *
 * Components take a Clock& instead of calling system_clock directly so that
 * TTL and ETA behaviour can be driven deterministically.
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }

    static SystemClock& instance() {
        static SystemClock clock;
        return clock;
    }
};

/**
 * @brief Manually advanced clock for tests and simulations
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(TimePoint start = from_epoch_ms(1'700'000'000'000))
        : now_(start) {}

    TimePoint now() const override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void advance(Millis delta) {
        std::lock_guard lock(mutex_);
        now_ += delta;
    }

    void set(TimePoint tp) {
        std::lock_guard lock(mutex_);
        now_ = tp;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace ofs
