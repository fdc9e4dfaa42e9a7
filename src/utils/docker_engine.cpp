/**
 * @file docker_engine.cpp
 * @brief Implementation of the Docker ContainerEngine
 *
 * **Command Mapping**:
 * ```
 * Inspect      → docker inspect --type container <c>
 * List         → docker ps --no-trunc --format {{json .}} [--all]
 * Stop         → docker stop --time <s> <c>
 * Kill         → docker kill <c>
 * Rename       → docker rename <c> <name>
 * Create       → curl --unix-socket <sock> POST /containers/create?name=..&platform=..
 * Remove       → docker rm [--force] <c>       (missing container = success)
 * RemoveImage  → docker rmi [--force] <image>  (missing image = success)
 * Info         → docker info --format {{json .}}
 * Events       → docker events --filter type=container --filter event=destroy
 * ```
 *
 * @date 2025
 */

#include "sandkeep/utils/docker_engine.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <system_error>

using json = nlohmann::json;

namespace sandkeep {
namespace utils {

namespace {

// curl exit codes that mean the daemon could not be reached
constexpr int kCurlCouldNotConnect = 7;
constexpr int kCurlOperationTimedOut = 28;

std::map<std::string, std::string> ToStringMap(const json& j) {
    std::map<std::string, std::string> result;
    if (!j.is_object()) {
        return result;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) {
            result[it.key()] = it.value().get<std::string>();
        } else if (!it.value().is_null()) {
            result[it.key()] = it.value().dump();
        }
    }
    return result;
}

std::string StripLeadingSlash(std::string name) {
    if (!name.empty() && name.front() == '/') {
        name.erase(0, 1);
    }
    return name;
}

} // anonymous namespace

std::string EngineErrorKindToString(EngineErrorKind kind) {
    switch (kind) {
        case EngineErrorKind::NOT_FOUND: return "not_found";
        case EngineErrorKind::UNAVAILABLE: return "unavailable";
        case EngineErrorKind::CONFLICT: return "conflict";
        case EngineErrorKind::FAILED: return "failed";
    }
    return "failed";
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

DockerEngine::DockerEngine(CommandRunner& runner, const DockerEngineConfig& config)
    : runner_(runner)
    , config_(config) {
    spdlog::debug("Docker engine adapter: binary={}, socket={}",
                  config_.docker_binary, config_.docker_socket);
}

bool DockerEngine::IsDaemonRunning() {
    return ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"}).success;
}

// ============================================================================
// CONTAINER INFORMATION RETRIEVAL
// ============================================================================

ContainerDescriptor DockerEngine::Inspect(const std::string& container) {
    auto result = ExecuteDockerCommand({"inspect", "--type", "container", container});
    if (!result.success) {
        ThrowCommandError("inspect " + container, result);
    }

    try {
        return ParseInspectOutput(result.stdout_output);
    }
    catch (const json::exception& e) {
        throw EngineError(EngineErrorKind::FAILED,
                          "failed to parse inspect output for " + container + ": " + e.what());
    }
}

std::vector<ContainerDescriptor> DockerEngine::List(bool all) {
    std::vector<std::string> args = {"ps", "--no-trunc", "--format", "{{json .}}"};
    if (all) {
        args.push_back("--all");
    }

    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        ThrowCommandError("list containers", result);
    }

    std::vector<ContainerDescriptor> containers;
    std::istringstream stream(result.stdout_output);
    std::string line;

    // Parse JSON output line by line
    while (std::getline(stream, line)) {
        if (StringUtils::Trim(line).empty()) continue;

        try {
            containers.push_back(ParseListLine(line));
        }
        catch (const json::exception& e) {
            spdlog::warn("Failed to parse container info: {}", e.what());
        }
    }

    return containers;
}

EngineInfo DockerEngine::Info() {
    auto result = ExecuteDockerCommand({"info", "--format", "{{json .}}"});
    if (!result.success) {
        ThrowCommandError("get docker info", result);
    }

    try {
        return ParseInfoOutput(result.stdout_output);
    }
    catch (const json::exception& e) {
        throw EngineError(EngineErrorKind::FAILED,
                          std::string("failed to parse docker info: ") + e.what());
    }
}

// ============================================================================
// CONTAINER LIFECYCLE MANAGEMENT
// ============================================================================

void DockerEngine::Stop(const std::string& container, std::chrono::seconds timeout) {
    spdlog::info("Stopping container: {} (timeout: {}s)", container, timeout.count());

    // The CLI call itself may take the full grace period plus the kill
    auto result = ExecuteDockerCommand({"stop", "--time", std::to_string(timeout.count()), container},
                                       timeout + config_.command_timeout);
    if (!result.success) {
        ThrowCommandError("stop " + container, result);
    }
}

void DockerEngine::Kill(const std::string& container) {
    spdlog::info("Killing container: {}", container);

    auto result = ExecuteDockerCommand({"kill", container});
    if (!result.success) {
        ThrowCommandError("kill " + container, result);
    }
}

void DockerEngine::Rename(const std::string& container, const std::string& new_name) {
    spdlog::debug("Renaming container {} -> {}", container, new_name);

    auto result = ExecuteDockerCommand({"rename", container, new_name});
    if (!result.success) {
        ThrowCommandError("rename " + container, result);
    }
}

std::string DockerEngine::Create(const json& config,
                                 const json& host_config,
                                 const Platform& platform,
                                 const std::string& name) {
    spdlog::info("Creating container: {}", name);

    json body = config.is_object() ? config : json::object();
    body["HostConfig"] = host_config;

    std::string url = "http://localhost/containers/create?name=" + StringUtils::UrlEncode(name) +
                      "&platform=" + StringUtils::UrlEncode(platform.os + "/" + platform.architecture);

    CommandOptions options;
    options.timeout = config_.command_timeout;
    options.stdin_data = body.dump();

    CommandResult result;
    try {
        result = runner_.Run({
            config_.curl_binary,
            "--silent", "--show-error",
            "--unix-socket", config_.docker_socket,
            "-X", "POST",
            "-H", "Content-Type: application/json",
            "--data-binary", "@-",
            "--write-out", "\n%{http_code}",
            url
        }, options);
    }
    catch (const std::system_error& e) {
        throw EngineError(EngineErrorKind::UNAVAILABLE,
                          std::string("failed to launch curl: ") + e.what());
    }

    if (result.exit_code == kCurlCouldNotConnect || result.exit_code == kCurlOperationTimedOut ||
        result.timed_out) {
        throw EngineError(EngineErrorKind::UNAVAILABLE,
                          "docker daemon unreachable: " + StringUtils::Trim(result.stderr_output));
    }
    if (!result.success) {
        ThrowCommandError("create " + name, result);
    }

    // Last line carries the HTTP status code
    std::string output = StringUtils::Trim(result.stdout_output);
    auto newline = output.rfind('\n');
    std::string status_line = newline == std::string::npos ? output : output.substr(newline + 1);
    std::string response = newline == std::string::npos ? "" : output.substr(0, newline);

    int status = 0;
    try {
        status = std::stoi(status_line);
    }
    catch (const std::exception&) {
        throw EngineError(EngineErrorKind::FAILED, "unexpected create response: " + output);
    }

    json parsed = json::parse(response, nullptr, false);

    if (status == 201) {
        if (parsed.is_discarded() || !parsed.contains("Id")) {
            throw EngineError(EngineErrorKind::FAILED, "create response missing container id");
        }
        for (const auto& warning : parsed.value("Warnings", json::array())) {
            if (warning.is_string()) {
                spdlog::warn("Create warning: {}", warning.get<std::string>());
            }
        }
        std::string id = parsed["Id"].get<std::string>();
        spdlog::info("Container created: {}", id);
        return id;
    }

    std::string message = (!parsed.is_discarded() && parsed.is_object())
                              ? parsed.value("message", response)
                              : response;

    EngineErrorKind kind = EngineErrorKind::FAILED;
    if (status == 404) {
        kind = EngineErrorKind::NOT_FOUND;
    } else if (status == 409) {
        kind = EngineErrorKind::CONFLICT;
    } else if (status == 503) {
        kind = EngineErrorKind::UNAVAILABLE;
    }

    throw EngineError(kind, "create " + name + " failed (HTTP " + std::to_string(status) + "): " + message);
}

void DockerEngine::Remove(const std::string& container, bool force) {
    spdlog::info("Removing container: {} (force: {})", container, force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container);

    auto result = ExecuteDockerCommand(args);
    if (result.success) {
        spdlog::info("Container removed successfully");
        return;
    }

    if (ClassifyError(result.stderr_output) == EngineErrorKind::NOT_FOUND) {
        spdlog::info("Container already removed and not found: {}", container);
        return;
    }

    ThrowCommandError("remove " + container, result);
}

void DockerEngine::RemoveImage(const std::string& image, bool force) {
    std::vector<std::string> args = {"rmi"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(image);

    auto result = ExecuteDockerCommand(args);
    if (result.success) {
        spdlog::info("Image deleted successfully: {}", image);
        return;
    }

    if (ClassifyError(result.stderr_output) == EngineErrorKind::NOT_FOUND) {
        spdlog::info("Image already removed and not found: {}", image);
        return;
    }

    ThrowCommandError("remove image " + image, result);
}

// ============================================================================
// EVENTS
// ============================================================================

void DockerEngine::WatchDestroyEvents(const std::function<void(const ContainerEvent&)>& on_event,
                                      const CancellationToken& cancel) {
    CommandOptions options;
    options.cancel = &cancel;

    auto result = runner_.Stream({
        config_.docker_binary, "events",
        "--filter", "type=container",
        "--filter", "event=destroy",
        "--format", "{{json .}}"
    }, [&](const std::string& line) {
        if (StringUtils::Trim(line).empty()) {
            return;
        }
        try {
            on_event(ParseEventLine(line));
        }
        catch (const json::exception& e) {
            spdlog::warn("Failed to parse docker event: {}", e.what());
        }
    }, options);

    if (cancel.IsCancelled()) {
        return;
    }

    if (!result.success) {
        ThrowCommandError("watch events", result);
    }
    throw EngineError(EngineErrorKind::UNAVAILABLE, "docker event stream closed");
}

// ============================================================================
// PARSING
// ============================================================================

ContainerDescriptor DockerEngine::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // Docker inspect returns array with single object
    if (j.is_array()) {
        if (j.empty()) {
            throw EngineError(EngineErrorKind::NOT_FOUND, "inspect returned no containers");
        }
        j = j[0];
    }

    ContainerDescriptor info;
    info.id = j.value("Id", "");
    info.name = StripLeadingSlash(j.value("Name", ""));

    if (j.contains("State") && j["State"].is_object()) {
        info.running = j["State"].value("Running", false);
        info.status = j["State"].value("Status", "");
    }

    if (j.contains("Config") && j["Config"].is_object()) {
        info.config = j["Config"];
    }

    if (j.contains("HostConfig") && j["HostConfig"].is_object()) {
        info.host_config = j["HostConfig"];
        info.storage_opt = ToStringMap(info.host_config.value("StorageOpt", json()));
    }

    if (j.contains("GraphDriver") && j["GraphDriver"].is_object()) {
        info.graph_driver_name = j["GraphDriver"].value("Name", "");
        info.graph_driver_data = ToStringMap(j["GraphDriver"].value("Data", json()));
    }

    return info;
}

ContainerDescriptor DockerEngine::ParseListLine(const std::string& line) {
    json j = json::parse(line);

    ContainerDescriptor info;
    info.id = j.value("ID", "");

    // Names is comma-separated when a container has links
    auto names = StringUtils::Split(j.value("Names", ""), ',');
    info.name = names.empty() ? "" : StripLeadingSlash(names.front());

    info.status = StringUtils::ToLower(j.value("State", ""));
    info.running = (info.status == "running");
    return info;
}

EngineInfo DockerEngine::ParseInfoOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    EngineInfo info;
    info.storage_driver = j.value("Driver", "");

    // DriverStatus: [["Backing Filesystem", "xfs"], ["Supports d_type", "true"], ...]
    auto driver_status = j.value("DriverStatus", json::array());
    if (driver_status.is_array()) {
        for (const auto& entry : driver_status) {
            if (entry.is_array() && entry.size() == 2 && entry[0].is_string() &&
                entry[1].is_string() && entry[0].get<std::string>() == "Backing Filesystem") {
                info.backing_filesystem = StringUtils::ToLower(entry[1].get<std::string>());
            }
        }
    }

    return info;
}

ContainerEvent DockerEngine::ParseEventLine(const std::string& line) {
    json j = json::parse(line);

    ContainerEvent event;
    event.action = j.value("Action", j.value("status", ""));
    event.container_id = j.value("id", "");

    if (j.contains("Actor") && j["Actor"].is_object()) {
        if (event.container_id.empty()) {
            event.container_id = j["Actor"].value("ID", "");
        }
        auto attributes = j["Actor"].value("Attributes", json::object());
        if (attributes.is_object()) {
            event.name = attributes.value("name", "");
        }
    }

    return event;
}

EngineErrorKind DockerEngine::ClassifyError(const std::string& diagnostics) {
    if (StringUtils::ContainsIgnoreCase(diagnostics, "no such container") ||
        StringUtils::ContainsIgnoreCase(diagnostics, "no such image") ||
        StringUtils::ContainsIgnoreCase(diagnostics, "no such object")) {
        return EngineErrorKind::NOT_FOUND;
    }

    if (StringUtils::ContainsIgnoreCase(diagnostics, "cannot connect to the docker daemon") ||
        StringUtils::ContainsIgnoreCase(diagnostics, "connection refused") ||
        StringUtils::ContainsIgnoreCase(diagnostics, "is the docker daemon running") ||
        StringUtils::ContainsIgnoreCase(diagnostics, "timeout") ||
        StringUtils::ContainsIgnoreCase(diagnostics, "timed out")) {
        return EngineErrorKind::UNAVAILABLE;
    }

    if (StringUtils::ContainsIgnoreCase(diagnostics, "conflict") ||
        StringUtils::ContainsIgnoreCase(diagnostics, "already in use")) {
        return EngineErrorKind::CONFLICT;
    }

    return EngineErrorKind::FAILED;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

CommandResult DockerEngine::ExecuteDockerCommand(const std::vector<std::string>& args) {
    return ExecuteDockerCommand(args, config_.command_timeout);
}

CommandResult DockerEngine::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                 std::chrono::seconds timeout) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(config_.docker_binary);
    argv.insert(argv.end(), args.begin(), args.end());

    CommandOptions options;
    options.timeout = timeout;

    try {
        return runner_.Run(argv, options);
    }
    catch (const std::system_error& e) {
        throw EngineError(EngineErrorKind::UNAVAILABLE,
                          std::string("failed to launch docker: ") + e.what());
    }
}

void DockerEngine::ThrowCommandError(const std::string& operation,
                                     const CommandResult& result) const {
    std::string diagnostics = StringUtils::Trim(result.stderr_output);
    if (diagnostics.empty()) {
        diagnostics = StringUtils::Trim(result.stdout_output);
    }

    EngineErrorKind kind = result.timed_out ? EngineErrorKind::UNAVAILABLE
                                            : ClassifyError(diagnostics);

    spdlog::debug("docker {} failed ({}): {}", operation, EngineErrorKindToString(kind), diagnostics);
    throw EngineError(kind, "failed to " + operation + ": " + diagnostics);
}

} // namespace utils
} // namespace sandkeep
