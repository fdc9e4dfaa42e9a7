/**
 * @file main.cpp
 * @brief sandkeepd - sandbox runner lifecycle daemon
 *
 * Entry point for the sandbox lifecycle control plane. `serve` keeps the
 * state cache consistent with the container engine (reconciliation loop,
 * destroy-event monitor, periodic pruning); `recover` runs one storage
 * quota recovery; `state` prints the persisted state cache.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "sandkeep/core/event_monitor.hpp"
#include "sandkeep/core/reconciliation_loop.hpp"
#include "sandkeep/core/runner_config.hpp"
#include "sandkeep/core/state_store.hpp"
#include "sandkeep/core/storage_recovery.hpp"
#include "sandkeep/utils/docker_engine.hpp"
#include "sandkeep/utils/periodic_task.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iostream>
#include <thread>

#include <pthread.h>

using json = nlohmann::json;
using namespace sandkeep;

/*******************************************************************************
 * Signal Handling
 ******************************************************************************/

namespace {

sigset_t ShutdownSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    return signals;
}

/**
 * @brief Block SIGINT/SIGTERM in every thread; they are collected with sigtimedwait
 */
void BlockShutdownSignals() {
    sigset_t signals = ShutdownSignals();
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
}

/**
 * @brief Wait until a shutdown signal arrives or @p done returns true
 * @return The received signal, or 0 if @p done ended the wait
 */
int WaitForShutdownSignal(const std::function<bool()>& done) {
    sigset_t signals = ShutdownSignals();
    timespec slice{0, 200 * 1000 * 1000};

    while (!done()) {
        int sig = sigtimedwait(&signals, nullptr, &slice);
        if (sig > 0) {
            return sig;
        }
    }
    return 0;
}

/*******************************************************************************
 * Commands
 ******************************************************************************/

void LoadSnapshotIfPresent(core::StateStore& store, const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        return;
    }
    try {
        store.LoadSnapshot(path);
    }
    catch (const std::runtime_error& e) {
        spdlog::warn("Ignoring state snapshot: {}", e.what());
    }
}

void SaveSnapshotIfConfigured(const core::StateStore& store, const std::string& path) {
    if (path.empty()) {
        return;
    }
    try {
        store.SaveSnapshot(path);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to save state snapshot: {}", e.what());
    }
}

int RunServe(const core::RunnerConfig& config) {
    utils::SubprocessRunner runner;
    utils::DockerEngine engine(runner, core::ToDockerEngineConfig(config));

    if (!engine.IsDaemonRunning()) {
        spdlog::warn("Docker daemon is not reachable yet; reconciliation will keep retrying");
    }

    core::StateStore store(config.cache_retention_days);
    LoadSnapshotIfPresent(store, config.state_snapshot_path);

    // Shares lock files with every `recover` process
    core::RecoveryLeases leases(config.lease_directory);

    core::ReconciliationLoop loop(engine, store, &leases);
    core::EventMonitor monitor(engine, store, [](const std::string& sandbox_id) {
        spdlog::debug("Released resources of destroyed sandbox {}", sandbox_id);
    }, std::chrono::seconds(5), &leases);
    utils::PeriodicTask pruner("state prune", [&](const utils::CancellationToken&) {
        store.Prune();
        SaveSnapshotIfConfigured(store, config.state_snapshot_path);
    });

    spdlog::info("[INIT] sandkeepd serving (sync every {}s, prune every {}s, retention {} days)",
                 config.sync_interval.count(), config.prune_interval.count(),
                 config.cache_retention_days);

    monitor.Start();
    loop.Start(config.sync_interval);
    pruner.Start(config.prune_interval);

    int sig = WaitForShutdownSignal([]() { return false; });
    spdlog::info("[STOP] Received signal {}, shutting down", sig);

    pruner.Stop();
    monitor.Stop();
    loop.Stop();
    SaveSnapshotIfConfigured(store, config.state_snapshot_path);

    spdlog::info("[DONE] sandkeepd stopped");
    return 0;
}

int RunRecover(const core::RunnerConfig& config,
               const std::string& sandbox_id,
               double original_quota_gb) {
    utils::SubprocessRunner runner;
    utils::DockerEngine engine(runner, core::ToDockerEngineConfig(config));

    core::StateStore store(config.cache_retention_days);
    LoadSnapshotIfPresent(store, config.state_snapshot_path);

    core::StorageRecovery recovery(engine, store, core::ToRecoveryOptions(config));

    // A signal cancels the recovery; from MARK_STOPPED on it runs to completion
    utils::CancellationToken cancel;
    std::atomic<bool> finished{false};
    std::thread signal_watcher([&]() {
        int sig = WaitForShutdownSignal([&]() { return finished.load(); });
        if (sig > 0) {
            spdlog::warn("Received signal {}, cancelling recovery", sig);
            cancel.Cancel();
        }
    });

    spdlog::info("[START] Recovering storage of sandbox {} (original quota {} GB)",
                 sandbox_id, original_quota_gb);
    auto result = recovery.Recover(sandbox_id, original_quota_gb, &cancel);

    finished = true;
    signal_watcher.join();

    SaveSnapshotIfConfigured(store, config.state_snapshot_path);

    json transitions = json::array();
    for (auto phase : result.transitions) {
        transitions.push_back(core::RecoveryPhaseToString(phase));
    }

    json report = {
        {"sandbox_id", sandbox_id},
        {"success", result.Succeeded()},
        {"error", core::RecoveryErrorKindToString(result.error)},
        {"message", result.error_message},
        {"retryable", result.has_error && core::IsRetryable(result.error)},
        {"original_quota_gb", original_quota_gb},
        {"new_quota_gb", result.context.new_quota_gb},
        {"new_quota_bytes", result.context.new_quota_bytes},
        {"data_copied", result.data_copied},
        {"transitions", transitions},
        {"warnings", result.compensation_warnings}
    };
    std::cout << report.dump(2) << std::endl;

    return result.Succeeded() ? 0 : 1;
}

int RunState(const core::RunnerConfig& config, const std::string& sandbox_id) {
    if (config.state_snapshot_path.empty()) {
        spdlog::error("[ERROR] No state snapshot configured (--state-snapshot)");
        return 1;
    }

    core::StateStore store(config.cache_retention_days);
    if (std::filesystem::exists(config.state_snapshot_path)) {
        store.LoadSnapshot(config.state_snapshot_path);
    }

    auto to_json = [](const core::SandboxStateRecord& record) {
        return json{
            {"sandbox_id", record.sandbox_id},
            {"state", core::SandboxStateToString(record.state)},
            {"last_updated", std::chrono::duration_cast<std::chrono::seconds>(
                record.last_updated.time_since_epoch()).count()}
        };
    };

    if (!sandbox_id.empty()) {
        auto record = store.GetRecord(sandbox_id);
        if (!record) {
            spdlog::error("[ERROR] Sandbox {} not found", sandbox_id);
            return 1;
        }
        std::cout << to_json(*record).dump(2) << std::endl;
        return 0;
    }

    json records = json::array();
    for (const auto& record : store.Snapshot()) {
        records.push_back(to_json(record));
    }
    std::cout << records.dump(2) << std::endl;
    return 0;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandkeepd - sandbox runner lifecycle daemon"};
    app.require_subcommand(1);

    std::string config_path;
    std::string log_level;
    int retention_days = 0;
    std::string docker_binary;
    std::string docker_socket;
    std::string snapshot_path;
    std::string lease_dir;

    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    auto* log_level_opt = app.add_option("--log-level", log_level, "debug, info, warn or error");
    auto* retention_opt = app.add_option("--cache-retention-days", retention_days,
                                         "Days destroyed sandboxes stay in the state cache");
    auto* docker_opt = app.add_option("--docker-binary", docker_binary, "docker CLI executable");
    auto* socket_opt = app.add_option("--docker-socket", docker_socket, "Docker Engine API socket");
    auto* snapshot_opt = app.add_option("--state-snapshot", snapshot_path,
                                        "File the state cache is persisted to");
    auto* lease_opt = app.add_option("--lease-dir", lease_dir,
                                     "Directory of per-sandbox recovery lock files");

    auto* serve = app.add_subcommand("serve", "Run reconciliation, event monitoring and pruning");
    int sync_seconds = 0;
    int prune_seconds = 0;
    auto* sync_opt = serve->add_option("--sync-interval", sync_seconds,
                                       "Reconciliation interval in seconds");
    auto* prune_opt = serve->add_option("--prune-interval", prune_seconds,
                                        "State cache prune interval in seconds");

    auto* recover = app.add_subcommand("recover", "Expand a sandbox's storage quota by one step");
    std::string recover_id;
    double original_quota_gb = 0.0;
    recover->add_option("sandbox_id", recover_id, "Sandbox ID")->required();
    recover->add_option("--original-quota", original_quota_gb, "Provisioned quota in GB")
        ->required()
        ->check(CLI::PositiveNumber);

    auto* state = app.add_subcommand("state", "Print cached sandbox states as JSON");
    std::string state_id;
    state->add_option("sandbox_id", state_id, "Only print this sandbox");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_pattern("[%Y-%m-%dT%H:%M:%S%z] [%^%l%$] %v");

    try {
        // Defaults < config file < environment < flags
        core::RunnerConfig config;
        if (!config_path.empty()) {
            core::LoadConfigFile(config, config_path);
        }
        core::ApplyEnvironment(config);

        if (log_level_opt->count() > 0) config.log_level = log_level;
        if (retention_opt->count() > 0) config.cache_retention_days = retention_days;
        if (docker_opt->count() > 0) config.docker_binary = docker_binary;
        if (socket_opt->count() > 0) config.docker_socket = docker_socket;
        if (snapshot_opt->count() > 0) config.state_snapshot_path = snapshot_path;
        if (lease_opt->count() > 0) config.lease_directory = lease_dir;
        if (sync_opt->count() > 0) config.sync_interval = std::chrono::seconds(sync_seconds);
        if (prune_opt->count() > 0) config.prune_interval = std::chrono::seconds(prune_seconds);

        core::ValidateConfig(config);
        spdlog::set_level(core::ParseLogLevel(config.log_level));
        spdlog::debug("[DEBUG] Log level: {}", config.log_level);

        // Before any thread exists, so every thread inherits the mask
        BlockShutdownSignals();

        if (serve->parsed()) {
            return RunServe(config);
        }
        if (recover->parsed()) {
            return RunRecover(config, recover_id, original_quota_gb);
        }
        return RunState(config, state_id);

    } catch (const core::ConfigError& e) {
        spdlog::error("[ERROR] Configuration error: {}", e.what());
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    } catch (...) {
        spdlog::error("[ERROR] Unknown error occurred");
        return 1;
    }
}
