/**
 * @file event_monitor.cpp
 * @brief Implementation of the destroy-event monitor
 *
 * @date 2025
 */

#include "sandkeep/core/event_monitor.hpp"
#include "sandkeep/core/storage_recovery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace sandkeep {
namespace core {

EventMonitor::EventMonitor(utils::ContainerEngine& engine,
                           StateStore& store,
                           DestroyHook on_destroy,
                           std::chrono::milliseconds reconnect_delay,
                           const RecoveryLeases* leases)
    : engine_(engine)
    , store_(store)
    , on_destroy_(std::move(on_destroy))
    , reconnect_delay_(reconnect_delay)
    , leases_(leases) {
}

EventMonitor::~EventMonitor() {
    Stop();
}

void EventMonitor::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }

    cancel_.Reset();
    spdlog::info("Starting destroy event monitor");
    worker_ = std::thread([this]() { Watch(); });
}

void EventMonitor::Stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        cancel_.Cancel();
        worker = std::move(worker_);
    }

    worker.join();
    spdlog::info("Destroy event monitor stopped");
}

bool EventMonitor::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable();
}

void EventMonitor::HandleEvent(const utils::ContainerEvent& event) {
    if (event.action != "destroy") {
        return;
    }

    const std::string& sandbox_id = event.name.empty() ? event.container_id : event.name;
    if (sandbox_id.empty() || IsRecoveryAlias(sandbox_id)) {
        return;
    }

    if (leases_ && leases_->IsHeld(sandbox_id)) {
        spdlog::debug("Ignoring destroy of {}: recovery in progress", sandbox_id);
        return;
    }

    if (!event.name.empty() && NameBoundElsewhere(sandbox_id, event.container_id)) {
        spdlog::debug("Ignoring destroy of container {}: {} now belongs to another container",
                      event.container_id, sandbox_id);
        return;
    }

    spdlog::info("Sandbox {} destroyed", sandbox_id);
    store_.Set(sandbox_id, SandboxState::DESTROYED);
    ++events_handled_;

    if (on_destroy_) {
        try {
            on_destroy_(sandbox_id);
        }
        catch (const std::exception& e) {
            spdlog::error("Cleanup after destroy of {} failed: {}", sandbox_id, e.what());
        }
    }
}

bool EventMonitor::NameBoundElsewhere(const std::string& sandbox_id,
                                      const std::string& container_id) {
    if (container_id.empty()) {
        return false;
    }

    std::string current_id;
    try {
        current_id = engine_.Inspect(sandbox_id).id;
    }
    catch (const utils::EngineError& e) {
        if (e.Kind() != utils::EngineErrorKind::NOT_FOUND) {
            spdlog::warn("Cannot check owner of {} ({}): {}", sandbox_id,
                         utils::EngineErrorKindToString(e.Kind()), e.what());
        }
        return false;
    }

    // Either side may be an abbreviated ID
    auto shorter = std::min(current_id.size(), container_id.size());
    return shorter > 0 && current_id.compare(0, shorter, container_id, 0, shorter) != 0;
}

void EventMonitor::Watch() {
    while (!cancel_.IsCancelled()) {
        try {
            engine_.WatchDestroyEvents(
                [this](const utils::ContainerEvent& event) { HandleEvent(event); },
                cancel_);
        }
        catch (const utils::EngineError& e) {
            spdlog::warn("Event stream interrupted ({}): {}",
                         utils::EngineErrorKindToString(e.Kind()), e.what());
        }

        if (cancel_.WaitFor(reconnect_delay_)) {
            break;
        }
        spdlog::debug("Reconnecting to engine event stream");
    }
}

} // namespace core
} // namespace sandkeep
