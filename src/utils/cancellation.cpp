/**
 * @file cancellation.cpp
 * @brief Implementation of the cooperative cancellation token
 *
 * @date 2025
 */

#include "sandkeep/utils/cancellation.hpp"

namespace sandkeep {
namespace utils {

void CancellationToken::Cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void CancellationToken::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
}

void CancellationToken::ThrowIfCancelled(const std::string& operation) const {
    if (IsCancelled()) {
        throw CancelledError(operation + " cancelled");
    }
}

} // namespace utils
} // namespace sandkeep
