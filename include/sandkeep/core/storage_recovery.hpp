/**
 * @file storage_recovery.hpp
 * @brief Online storage-quota expansion for a sandbox that ran out of disk
 *
 * A sandbox's quota cannot be changed on a live container, so recovery
 * replaces the container: the original is stopped and renamed aside, a
 * clone with a larger quota is created under the sandbox ID, the writable
 * layer is copied across and the original is removed. Every step that can
 * leave the sandbox unreachable has a compensating action.
 *
 * **Quota arithmetic** (all values in GB):
 * ```
 * max_expansion     = original * max_expansion_ratio
 * current_expansion = current - original        (current = 0 when unset)
 * new_expansion     = current_expansion + increment
 * new_quota         = original + new_expansion
 * ```
 * Recovery is refused while new_expansion > max_expansion.
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/recovery_leases.hpp"
#include "sandkeep/core/state_store.hpp"
#include "sandkeep/utils/cancellation.hpp"
#include "sandkeep/utils/command_runner.hpp"
#include "sandkeep/utils/container_engine.hpp"
#include "sandkeep/utils/retry.hpp"
#include "sandkeep/utils/rsync.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandkeep {
namespace core {

/**
 * @enum RecoveryPhase
 * @brief States of the recovery state machine
 */
enum class RecoveryPhase {
    INSPECTING,          ///< Read the container and its quota
    VALIDATING,          ///< Quota ceiling and filesystem checks (no side effects)
    STOPPING,            ///< Stop the container if running
    RENAMING,            ///< Move the original aside to its recovery alias
    CREATING,            ///< Create the clone under the sandbox ID
    COMPENSATE_RENAME,   ///< Undo RENAMING after a failed create
    MARK_STOPPED,        ///< Record the sandbox as stopped
    COPYING,             ///< Copy the writable layer into the clone
    COMPENSATE_COPY,     ///< Drop the clone and restore the original
    REMOVING_OLD,        ///< Remove the renamed original
    DONE,                ///< Recovery complete
    FAILED               ///< Recovery aborted
};

/**
 * @enum RecoveryErrorKind
 * @brief Actionable reason a recovery did not complete
 */
enum class RecoveryErrorKind {
    NONE,
    STORAGE_EXPANSION_EXHAUSTED,   ///< Quota ceiling reached (permanent)
    UNSUPPORTED_FILESYSTEM,        ///< Engine storage cannot enforce quotas (permanent)
    INVALID_STORAGE_OPT,           ///< Current quota value unreadable (permanent)
    ENGINE_UNAVAILABLE,            ///< Daemon unreachable (transient)
    ENGINE_ERROR,                  ///< Daemon rejected an operation
    NOT_FOUND,                     ///< Sandbox container does not exist
    COPY_FAILED,                   ///< Layer copy failed; original restored
    RECOVERY_IN_PROGRESS,          ///< Another recovery holds the sandbox
    LEASE_FAILED,                  ///< Lease lock file unusable (permanent until fixed)
    CANCELLED                      ///< Caller cancelled before any commitment
};

std::string RecoveryPhaseToString(RecoveryPhase phase);
std::string RecoveryErrorKindToString(RecoveryErrorKind kind);

/**
 * @brief True when retrying the same request later may succeed
 */
bool IsRetryable(RecoveryErrorKind kind);

/**
 * @struct RecoveryOptions
 * @brief Tunables for one recovery
 */
struct RecoveryOptions {
    double quota_increment_gb{0.1};                   ///< Quota step per recovery
    double max_expansion_ratio{0.1};                  ///< Ceiling as a fraction of the original quota
    std::chrono::seconds stop_timeout{10};            ///< Grace period per stop attempt
    int stop_attempts{2};                             ///< Stop attempts before giving up
    std::chrono::milliseconds stop_retry_delay{1000}; ///< Pause between stop attempts
    std::chrono::seconds copy_timeout{300};           ///< Bound for the layer copy
    utils::RetryPolicy create_retry;                  ///< Backoff for container creation
    std::string required_filesystem{"xfs"};           ///< Backing filesystem that enforces quotas
    std::string layer_driver{"overlay2"};             ///< Graph driver exposing UpperDir
    std::string rsync_binary{"rsync"};                ///< Copy tool for the default copier
    std::filesystem::path lease_directory;            ///< Lease lock files; empty = in-process only
    utils::Platform platform;                         ///< Platform for the clone
};

/**
 * @struct RecoveryContext
 * @brief Values derived during one recovery (never persisted)
 */
struct RecoveryContext {
    std::string sandbox_id;
    double original_quota_gb{0.0};
    double current_storage_gb{0.0};
    double current_expansion_gb{0.0};
    double increment_gb{0.0};
    double new_expansion_gb{0.0};
    double new_quota_gb{0.0};
    double max_expansion_gb{0.0};
    std::int64_t new_quota_bytes{0};
    bool was_running{false};
    std::string old_alias;                  ///< <sandbox_id>-recovery-<unix seconds>
    std::string old_layer_path;             ///< Original UpperDir (empty if undiscoverable)
    std::string new_layer_path;             ///< Clone UpperDir (empty if undiscoverable)
    std::string new_container_id;
    utils::ContainerDescriptor original;    ///< Inspected original container
};

/**
 * @struct RecoveryResult
 * @brief Outcome of Recover()
 */
struct RecoveryResult {
    RecoveryErrorKind error{RecoveryErrorKind::NONE};
    bool has_error{false};
    std::string error_message;
    RecoveryPhase final_phase{RecoveryPhase::INSPECTING};
    std::vector<RecoveryPhase> transitions;               ///< Every phase entered, in order
    std::vector<std::string> compensation_warnings;       ///< Cleanup steps that failed
    bool data_copied{false};                              ///< Writable layer was copied
    RecoveryContext context;

    bool Succeeded() const { return !has_error && final_phase == RecoveryPhase::DONE; }
};

/// Copies the contents of one writable layer onto another
using LayerCopier = std::function<utils::CopyResult(const std::filesystem::path& source,
                                                    const std::filesystem::path& destination,
                                                    std::chrono::seconds timeout)>;

/// Current time in Unix seconds (used for recovery aliases)
using UnixClock = std::function<std::int64_t()>;

/**
 * @brief LayerCopier that runs rsync through @p runner
 */
LayerCopier MakeRsyncCopier(utils::CommandRunner& runner, const std::string& rsync_binary = "rsync");

/**
 * @brief Name the original container is parked under during recovery
 */
std::string MakeRecoveryAlias(const std::string& sandbox_id, std::int64_t unix_seconds);

/**
 * @brief True for names produced by MakeRecoveryAlias
 */
bool IsRecoveryAlias(const std::string& name);

/**
 * @class StorageRecoverySaga
 * @brief One run of the recovery state machine for one sandbox
 *
 * Each phase is a handler returning the next phase. Compensation phases
 * are explicit states, so the rollback path shows up in the transition
 * trace. A saga object runs once; callers must hold the sandbox's lease.
 *
 * Cancellation is honoured before STOPPING, before RENAMING and between
 * create attempts. From MARK_STOPPED on it is ignored; the copy is bounded
 * by its own timeout instead.
 */
class StorageRecoverySaga {
public:
    StorageRecoverySaga(utils::ContainerEngine& engine,
                        StateStore& store,
                        const RecoveryOptions& options,
                        LayerCopier copier,
                        UnixClock clock,
                        const utils::CancellationToken* cancel);

    StorageRecoverySaga(const StorageRecoverySaga&) = delete;
    StorageRecoverySaga& operator=(const StorageRecoverySaga&) = delete;

    RecoveryResult Run(const std::string& sandbox_id, double original_quota_gb);

private:
    utils::ContainerEngine& engine_;
    StateStore& store_;
    const RecoveryOptions& options_;
    LayerCopier copier_;
    UnixClock clock_;
    const utils::CancellationToken* cancel_;

    RecoveryContext ctx_;
    RecoveryResult result_;

    RecoveryPhase Step(RecoveryPhase phase);

    // Forward path
    RecoveryPhase Inspect();
    RecoveryPhase Validate();
    RecoveryPhase StopContainer();
    RecoveryPhase RenameOriginal();
    RecoveryPhase CreateReplacement();
    RecoveryPhase MarkStopped();
    RecoveryPhase CopyLayer();
    RecoveryPhase RemoveOld();

    // Compensation path
    RecoveryPhase CompensateRename();
    RecoveryPhase CompensateCopy();

    std::string ResolveLayerPath(const utils::ContainerDescriptor& container) const;
    bool Cancelled(const std::string& before_phase);
    void SetError(RecoveryErrorKind kind, const std::string& message);
    RecoveryPhase Fail(RecoveryErrorKind kind, const std::string& message);
    void Warn(const std::string& message);
};

/**
 * @class StorageRecovery
 * @brief Recovery entry point enforcing one recovery per sandbox
 *
 * **Usage Example**:
 * @code
 * StorageRecovery recovery(engine, store, options);
 * auto result = recovery.Recover("sandbox-1", 50.0);
 * if (!result.Succeeded()) {
 *     spdlog::error("{}: {}", RecoveryErrorKindToString(result.error), result.error_message);
 * }
 * @endcode
 */
class StorageRecovery {
public:
    /**
     * @param engine Container engine
     * @param store State cache updated once the clone exists
     * @param options Tunables
     * @param copier Layer copier (defaults to rsync via a subprocess runner)
     * @param clock Unix-seconds source (defaults to system_clock)
     */
    StorageRecovery(utils::ContainerEngine& engine,
                    StateStore& store,
                    RecoveryOptions options = RecoveryOptions{},
                    LayerCopier copier = nullptr,
                    UnixClock clock = nullptr);

    /**
     * @brief Grow the sandbox's quota by one increment
     *
     * A second call for a sandbox whose recovery is still running returns
     * RECOVERY_IN_PROGRESS without touching the engine. With a lease
     * directory this also holds across processes.
     *
     * @param sandbox_id Canonical sandbox ID (container name)
     * @param original_quota_gb Quota the sandbox was provisioned with
     * @param cancel Optional cancellation token of the calling operation
     */
    RecoveryResult Recover(const std::string& sandbox_id,
                           double original_quota_gb,
                           const utils::CancellationToken* cancel = nullptr);

    const RecoveryOptions& Options() const { return options_; }
    RecoveryLeases& Leases() { return leases_; }

private:
    utils::ContainerEngine& engine_;
    StateStore& store_;
    RecoveryOptions options_;
    std::unique_ptr<utils::CommandRunner> runner_;
    LayerCopier copier_;
    UnixClock clock_;
    RecoveryLeases leases_;
};

} // namespace core
} // namespace sandkeep
