/**
 * @file reconciliation_loop.hpp
 * @brief Periodic correction of drift between the state cache and the engine
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/recovery_leases.hpp"
#include "sandkeep/core/state_store.hpp"
#include "sandkeep/utils/container_engine.hpp"
#include "sandkeep/utils/periodic_task.hpp"

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @class ReconciliationLoop
 * @brief Re-reads engine truth on a fixed cadence and rewrites stale states
 *
 * Each cycle lists every container the engine knows (stopped ones too),
 * maps its status to a SandboxState and writes it to the StateStore where
 * the cached value differs. Cached non-terminal sandboxes the engine no
 * longer lists are marked DESTROYED (a missed destroy event), unless a
 * recovery lease is held for them. Drift is therefore bounded by one
 * interval.
 *
 * Engine failures inside a cycle are logged; the next tick retries. Nothing
 * propagates to the caller of Start().
 *
 * **Usage Example**:
 * @code
 * ReconciliationLoop loop(engine, store);
 * loop.Start(std::chrono::seconds(10));
 * // ...
 * loop.Stop();   // in-flight cycle finishes, no new cycle starts
 * @endcode
 */
class ReconciliationLoop {
public:
    /**
     * @param leases Recovery leases to respect (may be nullptr)
     */
    ReconciliationLoop(utils::ContainerEngine& engine,
                       StateStore& store,
                       const RecoveryLeases* leases = nullptr);
    ~ReconciliationLoop();

    ReconciliationLoop(const ReconciliationLoop&) = delete;
    ReconciliationLoop& operator=(const ReconciliationLoop&) = delete;

    /**
     * @brief Begin cycling in the background (first cycle runs immediately)
     */
    void Start(std::chrono::milliseconds interval);

    /**
     * @brief Stop cycling; waits for an in-flight cycle to finish
     */
    void Stop();

    bool IsRunning() const { return task_.IsRunning(); }

    /**
     * @brief Run one cycle synchronously
     * @return Number of StateStore entries corrected
     * @throws utils::EngineError if the engine cannot be listed
     */
    std::size_t RunOnce();

    /// Number of cycles completed by the background task
    std::size_t CycleCount() const { return task_.RunCount(); }

private:
    utils::ContainerEngine& engine_;
    StateStore& store_;
    const RecoveryLeases* leases_;
    utils::PeriodicTask task_;

    void Tick(const utils::CancellationToken& cancel);
    std::size_t MarkVanished(const std::vector<SandboxStateRecord>& cached_before,
                             const std::set<std::string>& listed);
};

} // namespace core
} // namespace sandkeep
