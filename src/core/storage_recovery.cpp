/**
 * @file storage_recovery.cpp
 * @brief Implementation of the storage recovery state machine
 *
 * **Transitions**:
 * ```
 * INSPECTING -> VALIDATING -> STOPPING -> RENAMING -> CREATING
 *   CREATING  -> MARK_STOPPED | COMPENSATE_RENAME -> FAILED
 *   MARK_STOPPED -> COPYING
 *   COPYING   -> REMOVING_OLD | COMPENSATE_COPY -> FAILED
 *   REMOVING_OLD -> DONE
 * ```
 * INSPECTING, VALIDATING, STOPPING and RENAMING fail straight to FAILED.
 *
 * @date 2025
 */

#include "sandkeep/core/storage_recovery.hpp"
#include "sandkeep/utils/storage_opt.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <thread>
#include <utility>

namespace sandkeep {
namespace core {

namespace {

constexpr const char* kRecoveryAliasMarker = "-recovery-";
constexpr const char* kUpperDirKey = "UpperDir";

RecoveryErrorKind FromEngineError(const utils::EngineError& e) {
    switch (e.Kind()) {
        case utils::EngineErrorKind::UNAVAILABLE: return RecoveryErrorKind::ENGINE_UNAVAILABLE;
        case utils::EngineErrorKind::NOT_FOUND: return RecoveryErrorKind::NOT_FOUND;
        default: return RecoveryErrorKind::ENGINE_ERROR;
    }
}

} // anonymous namespace

// ============================================================================
// NAMES AND HELPERS
// ============================================================================

std::string RecoveryPhaseToString(RecoveryPhase phase) {
    switch (phase) {
        case RecoveryPhase::INSPECTING: return "inspecting";
        case RecoveryPhase::VALIDATING: return "validating";
        case RecoveryPhase::STOPPING: return "stopping";
        case RecoveryPhase::RENAMING: return "renaming";
        case RecoveryPhase::CREATING: return "creating";
        case RecoveryPhase::COMPENSATE_RENAME: return "compensate_rename";
        case RecoveryPhase::MARK_STOPPED: return "mark_stopped";
        case RecoveryPhase::COPYING: return "copying";
        case RecoveryPhase::COMPENSATE_COPY: return "compensate_copy";
        case RecoveryPhase::REMOVING_OLD: return "removing_old";
        case RecoveryPhase::DONE: return "done";
        case RecoveryPhase::FAILED: return "failed";
        default: return "unknown";
    }
}

std::string RecoveryErrorKindToString(RecoveryErrorKind kind) {
    switch (kind) {
        case RecoveryErrorKind::NONE: return "none";
        case RecoveryErrorKind::STORAGE_EXPANSION_EXHAUSTED: return "storage_expansion_exhausted";
        case RecoveryErrorKind::UNSUPPORTED_FILESYSTEM: return "unsupported_filesystem";
        case RecoveryErrorKind::INVALID_STORAGE_OPT: return "invalid_storage_opt";
        case RecoveryErrorKind::ENGINE_UNAVAILABLE: return "engine_unavailable";
        case RecoveryErrorKind::ENGINE_ERROR: return "engine_error";
        case RecoveryErrorKind::NOT_FOUND: return "not_found";
        case RecoveryErrorKind::COPY_FAILED: return "copy_failed";
        case RecoveryErrorKind::RECOVERY_IN_PROGRESS: return "recovery_in_progress";
        case RecoveryErrorKind::LEASE_FAILED: return "lease_failed";
        case RecoveryErrorKind::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

bool IsRetryable(RecoveryErrorKind kind) {
    return kind == RecoveryErrorKind::ENGINE_UNAVAILABLE ||
           kind == RecoveryErrorKind::RECOVERY_IN_PROGRESS ||
           kind == RecoveryErrorKind::CANCELLED;
}

LayerCopier MakeRsyncCopier(utils::CommandRunner& runner, const std::string& rsync_binary) {
    return [&runner, rsync_binary](const std::filesystem::path& source,
                                   const std::filesystem::path& destination,
                                   std::chrono::seconds timeout) {
        return utils::RsyncCopy(runner, source, destination, timeout, rsync_binary);
    };
}

std::string MakeRecoveryAlias(const std::string& sandbox_id, std::int64_t unix_seconds) {
    return sandbox_id + kRecoveryAliasMarker + std::to_string(unix_seconds);
}

bool IsRecoveryAlias(const std::string& name) {
    const std::string marker = kRecoveryAliasMarker;
    auto pos = name.rfind(marker);
    if (pos == std::string::npos || pos == 0) {
        return false;
    }

    auto suffix = name.substr(pos + marker.size());
    if (suffix.empty()) {
        return false;
    }
    for (char c : suffix) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// STATE MACHINE
// ============================================================================

StorageRecoverySaga::StorageRecoverySaga(utils::ContainerEngine& engine,
                                         StateStore& store,
                                         const RecoveryOptions& options,
                                         LayerCopier copier,
                                         UnixClock clock,
                                         const utils::CancellationToken* cancel)
    : engine_(engine)
    , store_(store)
    , options_(options)
    , copier_(std::move(copier))
    , clock_(std::move(clock))
    , cancel_(cancel) {
}

RecoveryResult StorageRecoverySaga::Run(const std::string& sandbox_id, double original_quota_gb) {
    ctx_ = RecoveryContext{};
    ctx_.sandbox_id = sandbox_id;
    ctx_.original_quota_gb = original_quota_gb;
    result_ = RecoveryResult{};

    RecoveryPhase phase = RecoveryPhase::INSPECTING;
    while (phase != RecoveryPhase::DONE && phase != RecoveryPhase::FAILED) {
        result_.transitions.push_back(phase);
        spdlog::debug("Recovery {}: {}", sandbox_id, RecoveryPhaseToString(phase));
        phase = Step(phase);
    }
    result_.transitions.push_back(phase);
    result_.final_phase = phase;
    result_.context = ctx_;

    if (phase == RecoveryPhase::DONE) {
        spdlog::info("Storage expansion completed for {} ({:.2f} GB); container ready to be started",
                     sandbox_id, ctx_.new_quota_gb);
    } else {
        spdlog::error("Storage recovery for {} failed ({}): {}", sandbox_id,
                      RecoveryErrorKindToString(result_.error), result_.error_message);
    }

    return result_;
}

RecoveryPhase StorageRecoverySaga::Step(RecoveryPhase phase) {
    switch (phase) {
        case RecoveryPhase::INSPECTING: return Inspect();
        case RecoveryPhase::VALIDATING: return Validate();
        case RecoveryPhase::STOPPING: return StopContainer();
        case RecoveryPhase::RENAMING: return RenameOriginal();
        case RecoveryPhase::CREATING: return CreateReplacement();
        case RecoveryPhase::COMPENSATE_RENAME: return CompensateRename();
        case RecoveryPhase::MARK_STOPPED: return MarkStopped();
        case RecoveryPhase::COPYING: return CopyLayer();
        case RecoveryPhase::COMPENSATE_COPY: return CompensateCopy();
        case RecoveryPhase::REMOVING_OLD: return RemoveOld();
        default:
            return Fail(RecoveryErrorKind::ENGINE_ERROR,
                        "no handler for phase " + RecoveryPhaseToString(phase));
    }
}

// ============================================================================
// FORWARD PATH
// ============================================================================

RecoveryPhase StorageRecoverySaga::Inspect() {
    try {
        ctx_.original = engine_.Inspect(ctx_.sandbox_id);
    }
    catch (const utils::EngineError& e) {
        return Fail(FromEngineError(e), std::string("failed to inspect container: ") + e.what());
    }

    try {
        ctx_.current_storage_gb = utils::ParseStorageOptSizeGB(ctx_.original.storage_opt);
    }
    catch (const utils::StorageOptError& e) {
        return Fail(RecoveryErrorKind::INVALID_STORAGE_OPT, e.what());
    }

    ctx_.was_running = ctx_.original.running;
    ctx_.old_layer_path = ResolveLayerPath(ctx_.original);
    if (!ctx_.old_layer_path.empty()) {
        spdlog::debug("Overlay UpperDir of {}: {}", ctx_.sandbox_id, ctx_.old_layer_path);
    }

    return RecoveryPhase::VALIDATING;
}

RecoveryPhase StorageRecoverySaga::Validate() {
    ctx_.max_expansion_gb = ctx_.original_quota_gb * options_.max_expansion_ratio;
    ctx_.current_expansion_gb = ctx_.current_storage_gb - ctx_.original_quota_gb;
    ctx_.increment_gb = options_.quota_increment_gb;
    ctx_.new_expansion_gb = ctx_.current_expansion_gb + ctx_.increment_gb;
    ctx_.new_quota_gb = ctx_.original_quota_gb + ctx_.new_expansion_gb;

    spdlog::info("Sandbox storage recovery: sandbox={} original={}GB current={}GB "
                 "current_expansion={}GB increment={}GB new_expansion={}GB new_quota={}GB max_expansion={}GB",
                 ctx_.sandbox_id, ctx_.original_quota_gb, ctx_.current_storage_gb,
                 ctx_.current_expansion_gb, ctx_.increment_gb, ctx_.new_expansion_gb,
                 ctx_.new_quota_gb, ctx_.max_expansion_gb);

    if (ctx_.new_expansion_gb > ctx_.max_expansion_gb) {
        return Fail(RecoveryErrorKind::STORAGE_EXPANSION_EXHAUSTED,
                    "storage cannot be further expanded");
    }

    utils::EngineInfo info;
    try {
        info = engine_.Info();
    }
    catch (const utils::EngineError& e) {
        return Fail(FromEngineError(e), std::string("failed to get engine info: ") + e.what());
    }

    if (info.backing_filesystem != options_.required_filesystem) {
        return Fail(RecoveryErrorKind::UNSUPPORTED_FILESYSTEM,
                    "storage recovery requires " + options_.required_filesystem +
                    " filesystem, current filesystem: " +
                    (info.backing_filesystem.empty() ? "unknown" : info.backing_filesystem));
    }

    try {
        ctx_.new_quota_bytes = utils::GBToBytes(ctx_.new_quota_gb);
    }
    catch (const utils::StorageOptError& e) {
        return Fail(RecoveryErrorKind::INVALID_STORAGE_OPT, e.what());
    }
    return RecoveryPhase::STOPPING;
}

RecoveryPhase StorageRecoverySaga::StopContainer() {
    if (Cancelled("stopping")) {
        return RecoveryPhase::FAILED;
    }

    if (!ctx_.was_running) {
        return RecoveryPhase::RENAMING;
    }

    spdlog::info("Stopping sandbox {}", ctx_.sandbox_id);

    const int attempts = std::max(1, options_.stop_attempts);
    RecoveryErrorKind last_kind = RecoveryErrorKind::ENGINE_ERROR;
    std::string last_error = "container still running";

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            engine_.Stop(ctx_.sandbox_id, options_.stop_timeout);
            if (!engine_.Inspect(ctx_.sandbox_id).running) {
                return RecoveryPhase::RENAMING;
            }

            spdlog::warn("Sandbox {} still running after stop, killing", ctx_.sandbox_id);
            engine_.Kill(ctx_.sandbox_id);
            if (!engine_.Inspect(ctx_.sandbox_id).running) {
                return RecoveryPhase::RENAMING;
            }
            last_kind = RecoveryErrorKind::ENGINE_ERROR;
            last_error = "container still running";
        }
        catch (const utils::EngineError& e) {
            last_kind = FromEngineError(e);
            last_error = e.what();
            if (last_kind == RecoveryErrorKind::NOT_FOUND) {
                break;
            }
            spdlog::warn("Stop attempt {}/{} for {} failed: {}",
                         attempt, attempts, ctx_.sandbox_id, e.what());
        }

        if (attempt < attempts) {
            if (cancel_) {
                if (cancel_->WaitFor(options_.stop_retry_delay)) {
                    Cancelled("stopping");
                    return RecoveryPhase::FAILED;
                }
            } else {
                std::this_thread::sleep_for(options_.stop_retry_delay);
            }
        }
    }

    return Fail(last_kind, "failed to stop sandbox: " + last_error);
}

RecoveryPhase StorageRecoverySaga::RenameOriginal() {
    if (Cancelled("renaming")) {
        return RecoveryPhase::FAILED;
    }

    auto now = clock_ ? clock_()
                      : static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch()).count());
    ctx_.old_alias = MakeRecoveryAlias(ctx_.sandbox_id, now);
    spdlog::debug("Renaming container {} to {}", ctx_.sandbox_id, ctx_.old_alias);

    try {
        engine_.Rename(ctx_.sandbox_id, ctx_.old_alias);
    }
    catch (const utils::EngineError& e) {
        auto kind = FromEngineError(e);
        ctx_.old_alias.clear();
        return Fail(kind, std::string("failed to rename container: ") + e.what());
    }

    return RecoveryPhase::CREATING;
}

RecoveryPhase StorageRecoverySaga::CreateReplacement() {
    nlohmann::json host_config = ctx_.original.host_config;
    if (!host_config.is_object()) {
        host_config = nlohmann::json::object();
    }
    if (!host_config.contains("StorageOpt") || !host_config["StorageOpt"].is_object()) {
        host_config["StorageOpt"] = nlohmann::json::object();
    }
    host_config["StorageOpt"][utils::kStorageOptSizeKey] = std::to_string(ctx_.new_quota_bytes);

    spdlog::info("Setting storage size of {} to {} bytes ({} GB)", ctx_.sandbox_id,
                 ctx_.new_quota_bytes, utils::BytesToGB(ctx_.new_quota_bytes));

    try {
        ctx_.new_container_id = utils::RetryWithExponentialBackoff(
            "create sandbox " + ctx_.sandbox_id,
            options_.create_retry,
            cancel_,
            [&]() {
                return engine_.Create(ctx_.original.config, host_config,
                                      options_.platform, ctx_.sandbox_id);
            });
    }
    catch (const utils::CancelledError& e) {
        SetError(RecoveryErrorKind::CANCELLED, e.what());
        return RecoveryPhase::COMPENSATE_RENAME;
    }
    catch (const utils::EngineError& e) {
        SetError(FromEngineError(e), std::string("failed to create new container: ") + e.what());
        return RecoveryPhase::COMPENSATE_RENAME;
    }
    catch (const std::exception& e) {
        SetError(RecoveryErrorKind::ENGINE_ERROR, std::string("failed to create new container: ") + e.what());
        return RecoveryPhase::COMPENSATE_RENAME;
    }

    spdlog::info("Created container {} for sandbox {}", ctx_.new_container_id, ctx_.sandbox_id);
    return RecoveryPhase::MARK_STOPPED;
}

RecoveryPhase StorageRecoverySaga::MarkStopped() {
    // The clone is never started here; the lifecycle flow starts it once it sees it stopped
    store_.Set(ctx_.sandbox_id, SandboxState::STOPPED);
    return RecoveryPhase::COPYING;
}

RecoveryPhase StorageRecoverySaga::CopyLayer() {
    if (ctx_.old_layer_path.empty()) {
        spdlog::warn("Could not determine overlay path of {}, skipping data copy", ctx_.sandbox_id);
        return RecoveryPhase::REMOVING_OLD;
    }

    try {
        ctx_.new_layer_path = ResolveLayerPath(engine_.Inspect(ctx_.sandbox_id));
    }
    catch (const utils::EngineError& e) {
        SetError(RecoveryErrorKind::COPY_FAILED,
                 std::string("failed to copy data: failed to inspect new container: ") + e.what());
        return RecoveryPhase::COMPENSATE_COPY;
    }

    if (ctx_.new_layer_path.empty()) {
        spdlog::warn("Could not determine overlay path of new container {}, skipping data copy",
                     ctx_.sandbox_id);
        return RecoveryPhase::REMOVING_OLD;
    }

    spdlog::info("Copying writable layer {} -> {}", ctx_.old_layer_path, ctx_.new_layer_path);

    utils::CopyResult copy;
    try {
        copy = copier_(ctx_.old_layer_path, ctx_.new_layer_path, options_.copy_timeout);
    }
    catch (const std::exception& e) {
        copy.success = false;
        copy.diagnostics = e.what();
    }

    if (!copy.success) {
        std::string reason = copy.timed_out ? "copy timed out" : "copy failed";
        if (!copy.diagnostics.empty()) {
            reason += ": " + copy.diagnostics;
        }
        SetError(RecoveryErrorKind::COPY_FAILED, "failed to copy data: " + reason);
        return RecoveryPhase::COMPENSATE_COPY;
    }

    result_.data_copied = true;
    spdlog::debug("Data copy completed for {}", ctx_.sandbox_id);
    return RecoveryPhase::REMOVING_OLD;
}

RecoveryPhase StorageRecoverySaga::RemoveOld() {
    spdlog::debug("Removing old container {}", ctx_.old_alias);
    try {
        engine_.Remove(ctx_.old_alias, true);
    }
    catch (const utils::EngineError& e) {
        Warn("failed to remove old container " + ctx_.old_alias + ": " + e.what());
    }
    return RecoveryPhase::DONE;
}

// ============================================================================
// COMPENSATION PATH
// ============================================================================

RecoveryPhase StorageRecoverySaga::CompensateRename() {
    spdlog::info("Restoring {} to {}", ctx_.old_alias, ctx_.sandbox_id);
    try {
        engine_.Rename(ctx_.old_alias, ctx_.sandbox_id);
    }
    catch (const utils::EngineError& e) {
        Warn("failed to rename " + ctx_.old_alias + " back to " + ctx_.sandbox_id + ": " + e.what());
    }
    return RecoveryPhase::FAILED;
}

RecoveryPhase StorageRecoverySaga::CompensateCopy() {
    spdlog::warn("Old container {} preserved for manual data recovery", ctx_.old_alias);

    // By ID, so only the clone created by this recovery can be removed
    const std::string& replacement = ctx_.new_container_id.empty() ? ctx_.sandbox_id
                                                                    : ctx_.new_container_id;
    try {
        engine_.Remove(replacement, true);
    }
    catch (const utils::EngineError& e) {
        Warn("failed to remove new container " + replacement + ": " + e.what());
    }

    try {
        engine_.Rename(ctx_.old_alias, ctx_.sandbox_id);
    }
    catch (const utils::EngineError& e) {
        Warn("failed to rename " + ctx_.old_alias + " back to " + ctx_.sandbox_id + ": " + e.what());
    }

    return RecoveryPhase::FAILED;
}

// ============================================================================
// HELPERS
// ============================================================================

std::string StorageRecoverySaga::ResolveLayerPath(const utils::ContainerDescriptor& container) const {
    if (container.graph_driver_name != options_.layer_driver) {
        return "";
    }
    auto it = container.graph_driver_data.find(kUpperDirKey);
    return it != container.graph_driver_data.end() ? it->second : "";
}

bool StorageRecoverySaga::Cancelled(const std::string& before_phase) {
    if (cancel_ && cancel_->IsCancelled()) {
        SetError(RecoveryErrorKind::CANCELLED, "recovery cancelled before " + before_phase);
        return true;
    }
    return false;
}

void StorageRecoverySaga::SetError(RecoveryErrorKind kind, const std::string& message) {
    result_.error = kind;
    result_.has_error = true;
    result_.error_message = message;
}

RecoveryPhase StorageRecoverySaga::Fail(RecoveryErrorKind kind, const std::string& message) {
    SetError(kind, message);
    return RecoveryPhase::FAILED;
}

void StorageRecoverySaga::Warn(const std::string& message) {
    spdlog::warn("Recovery of {}: {}", ctx_.sandbox_id, message);
    result_.compensation_warnings.push_back(message);
}

// ============================================================================
// ENTRY POINT
// ============================================================================

StorageRecovery::StorageRecovery(utils::ContainerEngine& engine,
                                 StateStore& store,
                                 RecoveryOptions options,
                                 LayerCopier copier,
                                 UnixClock clock)
    : engine_(engine)
    , store_(store)
    , options_(std::move(options))
    , copier_(std::move(copier))
    , clock_(std::move(clock))
    , leases_(options_.lease_directory) {
    if (!copier_) {
        runner_ = std::make_unique<utils::SubprocessRunner>();
        copier_ = MakeRsyncCopier(*runner_, options_.rsync_binary);
    }
}

RecoveryResult StorageRecovery::Recover(const std::string& sandbox_id,
                                        double original_quota_gb,
                                        const utils::CancellationToken* cancel) {
    auto rejected = [&](RecoveryErrorKind kind, const std::string& message) {
        RecoveryResult result;
        result.error = kind;
        result.has_error = true;
        result.error_message = message;
        result.final_phase = RecoveryPhase::FAILED;
        result.transitions.push_back(RecoveryPhase::FAILED);
        result.context.sandbox_id = sandbox_id;
        result.context.original_quota_gb = original_quota_gb;
        return result;
    };

    RecoveryLeases::Lease lease;
    try {
        lease = leases_.TryAcquire(sandbox_id);
    }
    catch (const LeaseError& e) {
        spdlog::error("Recovery of {} rejected: {}", sandbox_id, e.what());
        return rejected(RecoveryErrorKind::LEASE_FAILED, e.what());
    }

    if (!lease) {
        spdlog::warn("Recovery of {} rejected: another recovery is in progress", sandbox_id);
        return rejected(RecoveryErrorKind::RECOVERY_IN_PROGRESS,
                        "recovery already in progress for " + sandbox_id);
    }

    StorageRecoverySaga saga(engine_, store_, options_, copier_, clock_, cancel);
    return saga.Run(sandbox_id, original_quota_gb);
}

} // namespace core
} // namespace sandkeep
