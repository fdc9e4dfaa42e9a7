/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation token shared between a task and its owner
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

namespace sandkeep {
namespace utils {

/**
 * @class CancelledError
 * @brief Thrown by blocking helpers that observe a cancelled token
 */
class CancelledError : public std::runtime_error {
public:
    explicit CancelledError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class CancellationToken
 * @brief Flag that can be raised once and waited on
 *
 * Cancellation is cooperative: holders check IsCancelled() between units of
 * work, and sleep with WaitFor() so a Cancel() wakes them early.
 *
 * **Thread Safety**: All methods are thread-safe.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Raise the flag and wake every waiter
     */
    void Cancel();

    /**
     * @brief Lower the flag so the token can be reused for a new run
     */
    void Reset();

    bool IsCancelled() const { return cancelled_.load(); }

    /**
     * @brief Sleep for up to @p duration
     * @return true if the token was cancelled before or during the wait
     */
    bool WaitFor(std::chrono::milliseconds duration) const;

    /**
     * @brief Throw CancelledError if the token is cancelled
     * @param operation Name used in the exception message
     */
    void ThrowIfCancelled(const std::string& operation) const;

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace utils
} // namespace sandkeep
