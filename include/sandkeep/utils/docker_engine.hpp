/**
 * @file docker_engine.hpp
 * @brief Docker implementation of the ContainerEngine boundary
 *
 * Drives the docker CLI for inspect/list/stop/kill/rename/rm/rmi/info/events
 * and posts raw create bodies to the Engine API socket, since `docker create`
 * cannot take a Config/HostConfig document verbatim.
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/utils/command_runner.hpp"
#include "sandkeep/utils/container_engine.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sandkeep {
namespace utils {

/**
 * @struct DockerEngineConfig
 * @brief Locations and timeouts for talking to the docker daemon
 */
struct DockerEngineConfig {
    std::string docker_binary{"docker"};                  ///< docker CLI executable
    std::string curl_binary{"curl"};                      ///< curl executable (create requests)
    std::string docker_socket{"/var/run/docker.sock"};    ///< Engine API unix socket
    std::chrono::seconds command_timeout{60};             ///< Bound for one CLI call
};

/**
 * @class DockerEngine
 * @brief ContainerEngine backed by the docker CLI
 *
 * **Usage Example**:
 * @code
 * SubprocessRunner runner;
 * DockerEngine engine(runner);
 *
 * auto info = engine.Info();
 * auto container = engine.Inspect("sandbox-1234");
 * if (container.running) {
 *     engine.Stop(container.id, std::chrono::seconds(10));
 * }
 * @endcode
 *
 * **Thread Safety**: Stateless apart from configuration; safe to share.
 */
class DockerEngine : public ContainerEngine {
public:
    explicit DockerEngine(CommandRunner& runner,
                          const DockerEngineConfig& config = DockerEngineConfig{});

    ContainerDescriptor Inspect(const std::string& container) override;
    std::vector<ContainerDescriptor> List(bool all) override;
    void Stop(const std::string& container, std::chrono::seconds timeout) override;
    void Kill(const std::string& container) override;
    void Rename(const std::string& container, const std::string& new_name) override;
    std::string Create(const nlohmann::json& config,
                       const nlohmann::json& host_config,
                       const Platform& platform,
                       const std::string& name) override;
    void Remove(const std::string& container, bool force) override;
    void RemoveImage(const std::string& image, bool force) override;
    EngineInfo Info() override;
    void WatchDestroyEvents(const std::function<void(const ContainerEvent&)>& on_event,
                            const CancellationToken& cancel) override;

    /**
     * @brief Check whether the daemon answers `docker info`
     */
    bool IsDaemonRunning();

    /**
     * @brief Parse `docker inspect` output (array or single object)
     */
    static ContainerDescriptor ParseInspectOutput(const std::string& json_str);

    /**
     * @brief Parse one `docker ps --format '{{json .}}'` line
     */
    static ContainerDescriptor ParseListLine(const std::string& line);

    /**
     * @brief Parse `docker info --format '{{json .}}'` output
     */
    static EngineInfo ParseInfoOutput(const std::string& json_str);

    /**
     * @brief Parse one `docker events --format '{{json .}}'` line
     */
    static ContainerEvent ParseEventLine(const std::string& line);

    /**
     * @brief Classify docker CLI diagnostics into an EngineErrorKind
     */
    static EngineErrorKind ClassifyError(const std::string& diagnostics);

private:
    CommandRunner& runner_;
    DockerEngineConfig config_;

    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args);
    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                       std::chrono::seconds timeout);
    [[noreturn]] void ThrowCommandError(const std::string& operation,
                                        const CommandResult& result) const;
};

} // namespace utils
} // namespace sandkeep
