#pragma once

#include "ofs/core/clock.hpp"
#include "ofs/core/result.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <thread>

namespace ofs {

/**
 * @brief Exponential backoff schedule
 *
 * delay_for(1) == base_delay, each further attempt multiplies by `multiplier`,
 * capped at max_delay. max_attempts counts the first try.
 */
struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    Millis base_delay{1000};
    Millis max_delay{30000};
    double multiplier = 2.0;

    Millis delay_for(std::uint32_t attempt) const;

    static RetryPolicy none() { return RetryPolicy{1, Millis{0}, Millis{0}, 1.0}; }
};

/**
 * @brief Sleep for `delay` in short slices, returning early once cancelled
 *
 * RETURNS: false when the wait was interrupted by cancellation
 */
bool interruptible_sleep(Millis delay, const std::function<bool()>& cancelled);

/**
 * @brief Run `fn` until it succeeds, fails with a non-retryable error, or
 *        the policy runs out of attempts
 *
 * Only Network and Timeout errors are retried. `cancelled` is polled before
 * every attempt and during backoff; a cancellation yields ErrorKind::Cancelled.
 * `on_retry(attempt, error)` is invoked before each backoff wait.
 */
template<typename T>
Result<T> retry_with_backoff(const RetryPolicy& policy,
                             const std::function<Result<T>()>& fn,
                             const std::function<bool()>& cancelled = {},
                             const std::function<void(std::uint32_t, const Error&)>& on_retry = {}) {
    const std::uint32_t attempts = std::max<std::uint32_t>(policy.max_attempts, 1);
    for (std::uint32_t attempt = 1;; ++attempt) {
        if (cancelled && cancelled()) {
            return Fail<T>(ErrorKind::Cancelled, "operation cancelled");
        }

        auto result = fn();
        if (result.is_ok() || !is_retryable(result.error().kind) || attempt >= attempts) {
            return result;
        }

        if (on_retry) {
            on_retry(attempt, result.error());
        }
        if (!interruptible_sleep(policy.delay_for(attempt), cancelled)) {
            return Fail<T>(ErrorKind::Cancelled, "operation cancelled");
        }
    }
}

} // namespace ofs
