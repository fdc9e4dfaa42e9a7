/**
 * @file runner_config.cpp
 * @brief Configuration loading and validation
 *
 * @date 2025
 */

#include "sandkeep/core/runner_config.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace sandkeep {
namespace core {

namespace {

void ReadInt(const json& j, const char* key, int& out) {
    if (!j.contains(key)) {
        return;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw ConfigError(std::string("config key '") + key + "' must be an integer");
    }
    out = value.get<int>();
}

void ReadSeconds(const json& j, const char* key, std::chrono::seconds& out) {
    int seconds = static_cast<int>(out.count());
    ReadInt(j, key, seconds);
    out = std::chrono::seconds(seconds);
}

void ReadMillis(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (!j.contains(key)) {
        return;
    }
    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw ConfigError(std::string("config key '") + key + "' must be an integer");
    }
    out = std::chrono::milliseconds(value.get<std::int64_t>());
}

void ReadDouble(const json& j, const char* key, double& out) {
    if (!j.contains(key)) {
        return;
    }
    const auto& value = j.at(key);
    if (!value.is_number()) {
        throw ConfigError(std::string("config key '") + key + "' must be a number");
    }
    out = value.get<double>();
}

void ReadString(const json& j, const char* key, std::string& out) {
    if (!j.contains(key)) {
        return;
    }
    const auto& value = j.at(key);
    if (!value.is_string()) {
        throw ConfigError(std::string("config key '") + key + "' must be a string");
    }
    out = value.get<std::string>();
}

const char* const kKnownKeys[] = {
    "cache_retention_days", "sync_interval_seconds", "prune_interval_seconds", "log_level",
    "docker_binary", "curl_binary", "docker_socket", "rsync_binary", "state_snapshot_path",
    "lease_directory",
    "stop_timeout_seconds", "stop_attempts", "copy_timeout_seconds",
    "quota_increment_gb", "max_expansion_ratio", "create_retry"
};

bool IsKnownKey(const std::string& key) {
    for (const char* known : kKnownKeys) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> ProcessEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

spdlog::level::level_enum ParseLogLevel(const std::string& level) {
    std::string name = utils::StringUtils::ToLower(utils::StringUtils::Trim(level));

    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void ApplyConfigJson(RunnerConfig& config, const json& config_json) {
    if (!config_json.is_object()) {
        throw ConfigError("config must be a JSON object");
    }

    for (const auto& item : config_json.items()) {
        if (!IsKnownKey(item.key())) {
            spdlog::warn("Ignoring unknown config key '{}'", item.key());
        }
    }

    ReadInt(config_json, "cache_retention_days", config.cache_retention_days);
    ReadSeconds(config_json, "sync_interval_seconds", config.sync_interval);
    ReadSeconds(config_json, "prune_interval_seconds", config.prune_interval);
    ReadString(config_json, "log_level", config.log_level);

    ReadString(config_json, "docker_binary", config.docker_binary);
    ReadString(config_json, "curl_binary", config.curl_binary);
    ReadString(config_json, "docker_socket", config.docker_socket);
    ReadString(config_json, "rsync_binary", config.rsync_binary);
    ReadString(config_json, "state_snapshot_path", config.state_snapshot_path);
    ReadString(config_json, "lease_directory", config.lease_directory);

    ReadSeconds(config_json, "stop_timeout_seconds", config.stop_timeout);
    ReadInt(config_json, "stop_attempts", config.stop_attempts);
    ReadSeconds(config_json, "copy_timeout_seconds", config.copy_timeout);
    ReadDouble(config_json, "quota_increment_gb", config.quota_increment_gb);
    ReadDouble(config_json, "max_expansion_ratio", config.max_expansion_ratio);

    if (config_json.contains("create_retry")) {
        const auto& retry = config_json.at("create_retry");
        if (!retry.is_object()) {
            throw ConfigError("config key 'create_retry' must be an object");
        }
        ReadInt(retry, "max_attempts", config.create_retry.max_attempts);
        ReadMillis(retry, "base_delay_ms", config.create_retry.base_delay);
        ReadMillis(retry, "max_delay_ms", config.create_retry.max_delay);
    }
}

void LoadConfigFile(RunnerConfig& config, const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file: " + path.string());
    }

    json config_json;
    try {
        config_json = json::parse(file);
    }
    catch (const json::parse_error& e) {
        throw ConfigError("invalid config file " + path.string() + ": " + e.what());
    }

    ApplyConfigJson(config, config_json);
    spdlog::debug("Loaded config file {}", path.string());
}

void ApplyEnvironment(RunnerConfig& config, const EnvLookup& lookup) {
    const EnvLookup& env = lookup ? lookup : EnvLookup(ProcessEnv);

    if (auto level = env("LOG_LEVEL")) {
        config.log_level = *level;
    }

    if (auto days = env("CACHE_RETENTION_DAYS")) {
        try {
            std::size_t consumed = 0;
            int value = std::stoi(*days, &consumed);
            if (consumed != utils::StringUtils::Trim(*days).size()) {
                throw std::invalid_argument(*days);
            }
            config.cache_retention_days = value;
        }
        catch (const std::logic_error&) {
            throw ConfigError("CACHE_RETENTION_DAYS must be an integer, got '" + *days + "'");
        }
    }
}

void ValidateConfig(const RunnerConfig& config) {
    if (config.cache_retention_days < 1) {
        throw ConfigError("cache_retention_days must be at least 1");
    }
    if (config.sync_interval.count() <= 0) {
        throw ConfigError("sync_interval must be positive");
    }
    if (config.prune_interval.count() <= 0) {
        throw ConfigError("prune_interval must be positive");
    }
    if (config.stop_timeout.count() < 0) {
        throw ConfigError("stop_timeout must not be negative");
    }
    if (config.stop_attempts < 1) {
        throw ConfigError("stop_attempts must be at least 1");
    }
    if (config.copy_timeout.count() <= 0) {
        throw ConfigError("copy_timeout must be positive");
    }
    if (config.create_retry.max_attempts < 1) {
        throw ConfigError("create_retry.max_attempts must be at least 1");
    }
    if (config.create_retry.base_delay.count() < 0 ||
        config.create_retry.max_delay < config.create_retry.base_delay) {
        throw ConfigError("create_retry delays must satisfy 0 <= base_delay <= max_delay");
    }
    if (!(config.quota_increment_gb > 0.0)) {
        throw ConfigError("quota_increment_gb must be positive");
    }
    if (!(config.max_expansion_ratio >= 0.0)) {
        throw ConfigError("max_expansion_ratio must not be negative");
    }
    if (config.docker_binary.empty()) {
        throw ConfigError("docker_binary must not be empty");
    }
    if (config.lease_directory.empty()) {
        throw ConfigError("lease_directory must not be empty");
    }
}

RecoveryOptions ToRecoveryOptions(const RunnerConfig& config) {
    RecoveryOptions options;
    options.quota_increment_gb = config.quota_increment_gb;
    options.max_expansion_ratio = config.max_expansion_ratio;
    options.stop_timeout = config.stop_timeout;
    options.stop_attempts = config.stop_attempts;
    options.copy_timeout = config.copy_timeout;
    options.create_retry = config.create_retry;
    options.rsync_binary = config.rsync_binary;
    options.lease_directory = config.lease_directory;
    return options;
}

utils::DockerEngineConfig ToDockerEngineConfig(const RunnerConfig& config) {
    utils::DockerEngineConfig engine_config;
    engine_config.docker_binary = config.docker_binary;
    engine_config.curl_binary = config.curl_binary;
    engine_config.docker_socket = config.docker_socket;
    return engine_config;
}

} // namespace core
} // namespace sandkeep
