/**
 * @file periodic_task.cpp
 * @brief Implementation of the repeating background task
 *
 * @date 2025
 */

#include "sandkeep/utils/periodic_task.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sandkeep {
namespace utils {

PeriodicTask::PeriodicTask(std::string name, std::function<void(const CancellationToken&)> task)
    : name_(std::move(name))
    , task_(std::move(task)) {
}

PeriodicTask::~PeriodicTask() {
    Stop();
}

void PeriodicTask::Start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        spdlog::debug("{} already running", name_);
        return;
    }

    token_.Reset();
    spdlog::info("Starting {} (interval: {}ms)", name_, interval.count());
    worker_ = std::thread([this, interval]() { Loop(interval); });
}

void PeriodicTask::Stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        token_.Cancel();
        worker = std::move(worker_);
    }

    worker.join();
    spdlog::info("{} stopped", name_);
}

bool PeriodicTask::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable();
}

std::size_t PeriodicTask::RunCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_count_;
}

void PeriodicTask::Loop(std::chrono::milliseconds interval) {
    while (!token_.IsCancelled()) {
        try {
            task_(token_);
        }
        catch (const std::exception& e) {
            spdlog::error("{} run failed: {}", name_, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++run_count_;
        }

        if (token_.WaitFor(interval)) {
            break;
        }
    }
}

} // namespace utils
} // namespace sandkeep
