/**
 * @file periodic_task.hpp
 * @brief Background task that repeats on a fixed interval until stopped
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/utils/cancellation.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace sandkeep {
namespace utils {

/**
 * @class PeriodicTask
 * @brief Runs a callable immediately and then once per interval on its own thread
 *
 * Stop is cooperative: it is observed between runs, never in the middle of
 * one. Exceptions thrown by the callable are logged and the schedule
 * continues.
 *
 * **Thread Safety**: Start/Stop may be called from any thread.
 */
class PeriodicTask {
public:
    /**
     * @param name Task name used in log lines
     * @param task Callable invoked once per tick; receives the task's token
     */
    PeriodicTask(std::string name, std::function<void(const CancellationToken&)> task);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Start ticking; a no-op if already running
     */
    void Start(std::chrono::milliseconds interval);

    /**
     * @brief Stop ticking and wait for an in-flight run to finish
     *
     * No run starts after Stop returns.
     */
    void Stop();

    bool IsRunning() const;

    /// Number of completed runs (successful or not)
    std::size_t RunCount() const;

private:
    void Loop(std::chrono::milliseconds interval);

    std::string name_;
    std::function<void(const CancellationToken&)> task_;
    CancellationToken token_;
    std::thread worker_;
    mutable std::mutex mutex_;
    std::size_t run_count_{0};
};

} // namespace utils
} // namespace sandkeep
