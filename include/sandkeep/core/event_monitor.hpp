/**
 * @file event_monitor.hpp
 * @brief Feeds engine destroy events into the state cache
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/recovery_leases.hpp"
#include "sandkeep/core/state_store.hpp"
#include "sandkeep/utils/cancellation.hpp"
#include "sandkeep/utils/container_engine.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace sandkeep {
namespace core {

/**
 * @class EventMonitor
 * @brief Watches the engine's destroy events on a background thread
 *
 * Each destroyed sandbox is recorded as DESTROYED and handed to the
 * on_destroy hook (cleanup of resources tied to the sandbox). Containers
 * parked under a recovery alias are ignored, as are destroys of a sandbox
 * under a recovery lease and destroys of a container that no longer owns
 * the sandbox's name (the clone a failed recovery removed). A broken event
 * stream is re-established after a delay until Stop() is called.
 */
class EventMonitor {
public:
    using DestroyHook = std::function<void(const std::string& sandbox_id)>;

    EventMonitor(utils::ContainerEngine& engine,
                 StateStore& store,
                 DestroyHook on_destroy = nullptr,
                 std::chrono::milliseconds reconnect_delay = std::chrono::seconds(5),
                 const RecoveryLeases* leases = nullptr);
    ~EventMonitor();

    EventMonitor(const EventMonitor&) = delete;
    EventMonitor& operator=(const EventMonitor&) = delete;

    void Start();

    /**
     * @brief Cancel the event stream and join the watcher thread
     */
    void Stop();

    bool IsRunning() const;

    /**
     * @brief Apply one event (called by the watcher; public for tests)
     */
    void HandleEvent(const utils::ContainerEvent& event);

    std::size_t EventsHandled() const { return events_handled_.load(); }

private:
    utils::ContainerEngine& engine_;
    StateStore& store_;
    DestroyHook on_destroy_;
    std::chrono::milliseconds reconnect_delay_;
    const RecoveryLeases* leases_;

    utils::CancellationToken cancel_;
    std::thread worker_;
    mutable std::mutex mutex_;
    std::atomic<std::size_t> events_handled_{0};

    void Watch();
    bool NameBoundElsewhere(const std::string& sandbox_id, const std::string& container_id);
};

} // namespace core
} // namespace sandkeep
