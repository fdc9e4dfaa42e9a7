/**
 * @file reconciliation_loop.cpp
 * @brief Implementation of the reconciliation loop
 *
 * @date 2025
 */

#include "sandkeep/core/reconciliation_loop.hpp"
#include "sandkeep/core/storage_recovery.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace sandkeep {
namespace core {

ReconciliationLoop::ReconciliationLoop(utils::ContainerEngine& engine,
                                       StateStore& store,
                                       const RecoveryLeases* leases)
    : engine_(engine)
    , store_(store)
    , leases_(leases)
    , task_("reconciliation loop",
            [this](const utils::CancellationToken& cancel) { Tick(cancel); }) {
}

ReconciliationLoop::~ReconciliationLoop() {
    Stop();
}

void ReconciliationLoop::Start(std::chrono::milliseconds interval) {
    task_.Start(interval);
}

void ReconciliationLoop::Stop() {
    task_.Stop();
}

std::size_t ReconciliationLoop::RunOnce() {
    // Taken before listing: a record written after the list call is left alone
    auto cached_before = store_.Snapshot();
    auto containers = engine_.List(true);
    std::size_t corrected = 0;
    std::set<std::string> listed;

    for (const auto& container : containers) {
        const std::string& sandbox_id = container.name.empty() ? container.id : container.name;
        listed.insert(sandbox_id);
        if (!container.id.empty()) {
            listed.insert(container.id);
        }

        // Renamed originals left behind by a recovery are not sandboxes
        if (IsRecoveryAlias(sandbox_id)) {
            continue;
        }

        SandboxState live = SandboxStateFromContainerStatus(container.status);
        if (live == SandboxState::UNKNOWN) {
            spdlog::debug("Sandbox {} has unmapped status '{}'", sandbox_id, container.status);
            continue;
        }

        auto cached = store_.Get(sandbox_id);
        if (cached && *cached == live) {
            continue;
        }

        spdlog::info("Reconciling sandbox {}: {} -> {}", sandbox_id,
                     cached ? SandboxStateToString(*cached) : "none",
                     SandboxStateToString(live));
        store_.Set(sandbox_id, live);
        ++corrected;
    }

    corrected += MarkVanished(cached_before, listed);

    spdlog::debug("Reconciliation cycle checked {} containers, corrected {}",
                  containers.size(), corrected);
    return corrected;
}

std::size_t ReconciliationLoop::MarkVanished(const std::vector<SandboxStateRecord>& cached_before,
                                             const std::set<std::string>& listed) {
    std::size_t corrected = 0;

    for (const auto& record : cached_before) {
        if (IsTerminalState(record.state) || listed.count(record.sandbox_id) > 0) {
            continue;
        }

        // Between rename and create a recovering sandbox is briefly unlisted
        if (leases_ && leases_->IsHeld(record.sandbox_id)) {
            spdlog::debug("Sandbox {} not listed but under recovery, leaving it", record.sandbox_id);
            continue;
        }

        auto current = store_.GetRecord(record.sandbox_id);
        if (!current || current->last_updated != record.last_updated) {
            continue;
        }

        spdlog::info("Reconciling sandbox {}: {} -> {} (container no longer exists)",
                     record.sandbox_id, SandboxStateToString(record.state),
                     SandboxStateToString(SandboxState::DESTROYED));
        store_.Set(record.sandbox_id, SandboxState::DESTROYED);
        ++corrected;
    }

    return corrected;
}

void ReconciliationLoop::Tick(const utils::CancellationToken& cancel) {
    if (cancel.IsCancelled()) {
        return;
    }

    try {
        RunOnce();
    }
    catch (const utils::EngineError& e) {
        spdlog::warn("Reconciliation cycle failed ({}): {}",
                     utils::EngineErrorKindToString(e.Kind()), e.what());
    }
}

} // namespace core
} // namespace sandkeep
