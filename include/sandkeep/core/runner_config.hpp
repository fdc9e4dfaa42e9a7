/**
 * @file runner_config.hpp
 * @brief Daemon configuration: defaults, JSON file, environment, validation
 *
 * Sources are layered lowest to highest: built-in defaults, the JSON file
 * given with --config, the environment (LOG_LEVEL, CACHE_RETENTION_DAYS),
 * then command-line flags (applied by main).
 *
 * **Config File Example**:
 * ```
 * {
 *   "cache_retention_days": 7,
 *   "sync_interval_seconds": 10,
 *   "prune_interval_seconds": 3600,
 *   "log_level": "info",
 *   "docker_binary": "docker",
 *   "docker_socket": "/var/run/docker.sock",
 *   "state_snapshot_path": "/var/lib/sandkeep/states.json",
 *   "lease_directory": "/run/sandkeep/leases",
 *   "stop_timeout_seconds": 10,
 *   "stop_attempts": 2,
 *   "copy_timeout_seconds": 300,
 *   "quota_increment_gb": 0.1,
 *   "max_expansion_ratio": 0.1,
 *   "create_retry": {"max_attempts": 5, "base_delay_ms": 1000, "max_delay_ms": 10000}
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/core/storage_recovery.hpp"
#include "sandkeep/utils/docker_engine.hpp"
#include "sandkeep/utils/retry.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace sandkeep {
namespace core {

/**
 * @class ConfigError
 * @brief Invalid or unreadable configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @struct RunnerConfig
 * @brief Everything the daemon needs to wire its components
 */
struct RunnerConfig {
    int cache_retention_days{7};                          ///< StateStore retention window
    std::chrono::seconds sync_interval{10};               ///< Reconciliation cadence
    std::chrono::seconds prune_interval{3600};            ///< StateStore prune cadence
    std::string log_level{"info"};                        ///< debug, info, warn, error

    std::string docker_binary{"docker"};
    std::string curl_binary{"curl"};
    std::string docker_socket{"/var/run/docker.sock"};
    std::string rsync_binary{"rsync"};
    std::string state_snapshot_path;                      ///< Empty = in-memory only
    std::string lease_directory{"/run/sandkeep/leases"};  ///< Recovery lock files shared by all processes

    std::chrono::seconds stop_timeout{10};
    int stop_attempts{2};
    std::chrono::seconds copy_timeout{300};
    double quota_increment_gb{0.1};
    double max_expansion_ratio{0.1};
    utils::RetryPolicy create_retry;
};

/// Looks up an environment variable; std::nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/**
 * @brief Map a level name to spdlog's level; unknown names give info
 */
spdlog::level::level_enum ParseLogLevel(const std::string& level);

/**
 * @brief Overlay the keys present in @p config_json onto @p config
 *
 * Unknown keys are ignored with a warning.
 *
 * @throws ConfigError when a known key has the wrong type
 */
void ApplyConfigJson(RunnerConfig& config, const nlohmann::json& config_json);

/**
 * @brief Read a JSON config file and overlay it onto @p config
 * @throws ConfigError if the file is missing, unparsable or mistyped
 */
void LoadConfigFile(RunnerConfig& config, const std::filesystem::path& path);

/**
 * @brief Overlay LOG_LEVEL and CACHE_RETENTION_DAYS
 * @param lookup Environment accessor (defaults to the process environment)
 * @throws ConfigError if CACHE_RETENTION_DAYS is not an integer
 */
void ApplyEnvironment(RunnerConfig& config, const EnvLookup& lookup = nullptr);

/**
 * @brief Reject values the components cannot work with
 * @throws ConfigError naming the first offending setting
 */
void ValidateConfig(const RunnerConfig& config);

RecoveryOptions ToRecoveryOptions(const RunnerConfig& config);

utils::DockerEngineConfig ToDockerEngineConfig(const RunnerConfig& config);

} // namespace core
} // namespace sandkeep
