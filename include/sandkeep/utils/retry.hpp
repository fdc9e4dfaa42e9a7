/**
 * @file retry.hpp
 * @brief Bounded retry with exponential backoff
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/utils/cancellation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <thread>

namespace sandkeep {
namespace utils {

/**
 * @struct RetryPolicy
 * @brief Attempt budget and delay curve for RetryWithExponentialBackoff
 */
struct RetryPolicy {
    int max_attempts{5};                              ///< Total attempts including the first
    std::chrono::milliseconds base_delay{1000};       ///< Delay after the first failure
    std::chrono::milliseconds max_delay{10000};       ///< Upper bound for any single delay
};

/**
 * @brief Delay to wait after the given failed attempt (1-based)
 */
inline std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt) {
    auto delay = policy.base_delay;
    for (int i = 1; i < attempt && delay < policy.max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, policy.max_delay);
}

/**
 * @brief Invoke @p fn until it returns without throwing or attempts run out
 *
 * Exceptions derived from std::exception are retried; the last one is
 * rethrown once the budget is exhausted. A cancelled token stops the loop
 * with CancelledError, either before an attempt or during a backoff wait.
 *
 * @param description Operation name for log lines
 * @param policy Attempt budget and delays
 * @param cancel Optional cancellation token
 * @param fn Callable to invoke
 * @return Whatever @p fn returns
 */
template <typename Fn>
auto RetryWithExponentialBackoff(const std::string& description,
                                 const RetryPolicy& policy,
                                 const CancellationToken* cancel,
                                 Fn&& fn) -> decltype(fn()) {
    const int attempts = std::max(1, policy.max_attempts);

    for (int attempt = 1;; ++attempt) {
        if (cancel) {
            cancel->ThrowIfCancelled(description);
        }

        try {
            return fn();
        }
        catch (const CancelledError&) {
            throw;
        }
        catch (const std::exception& e) {
            if (attempt >= attempts) {
                spdlog::error("{} failed after {} attempts: {}", description, attempt, e.what());
                throw;
            }

            auto delay = BackoffDelay(policy, attempt);
            spdlog::warn("{} failed (attempt {}/{}), retrying in {}ms: {}",
                         description, attempt, attempts, delay.count(), e.what());

            if (cancel) {
                if (cancel->WaitFor(delay)) {
                    throw CancelledError(description + " cancelled");
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }
}

} // namespace utils
} // namespace sandkeep
