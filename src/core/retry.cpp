#include "ofs/core/retry.hpp"

#include <cmath>

namespace ofs {

Millis RetryPolicy::delay_for(std::uint32_t attempt) const {
    if (attempt == 0 || base_delay.count() <= 0) {
        return Millis{0};
    }
    const double scaled = static_cast<double>(base_delay.count()) *
                          std::pow(multiplier, static_cast<double>(attempt - 1));
    const double capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return Millis{static_cast<Millis::rep>(capped)};
}

bool interruptible_sleep(Millis delay, const std::function<bool()>& cancelled) {
    constexpr Millis kSlice{20};
    auto remaining = delay;
    while (remaining.count() > 0) {
        if (cancelled && cancelled()) {
            return false;
        }
        const auto step = std::min(remaining, kSlice);
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
    return !(cancelled && cancelled());
}

} // namespace ofs
