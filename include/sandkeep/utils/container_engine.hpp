/**
 * @file container_engine.hpp
 * @brief Container engine boundary consumed by the lifecycle subsystem
 *
 * The reconciliation loop, the event monitor and the storage recovery saga
 * talk to the container engine only through ContainerEngine. The production
 * implementation is DockerEngine; tests substitute an in-memory engine.
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/utils/cancellation.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandkeep {
namespace utils {

/**
 * @enum EngineErrorKind
 * @brief Classification of engine failures
 */
enum class EngineErrorKind {
    NOT_FOUND,     ///< Container or image does not exist
    UNAVAILABLE,   ///< Daemon unreachable or request timed out (transient)
    CONFLICT,      ///< Name already in use or operation conflicts with state
    FAILED         ///< Any other daemon-side failure
};

/**
 * @class EngineError
 * @brief Exception thrown by ContainerEngine implementations
 */
class EngineError : public std::runtime_error {
public:
    EngineError(EngineErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    EngineErrorKind Kind() const { return kind_; }

private:
    EngineErrorKind kind_;
};

std::string EngineErrorKindToString(EngineErrorKind kind);

/**
 * @struct ContainerDescriptor
 * @brief Read-only view of one container as reported by the engine
 *
 * `config` and `host_config` are kept as the engine's own documents so a
 * container can be recreated from them with only targeted changes.
 */
struct ContainerDescriptor {
    std::string id;                                       ///< Engine container ID
    std::string name;                                     ///< Container name (no leading '/')
    bool running{false};                                  ///< State.Running
    std::string status;                                   ///< created, running, exited, ...
    std::map<std::string, std::string> storage_opt;       ///< HostConfig.StorageOpt
    std::string graph_driver_name;                        ///< GraphDriver.Name (overlay2, ...)
    std::map<std::string, std::string> graph_driver_data; ///< GraphDriver.Data (UpperDir, ...)
    nlohmann::json config = nlohmann::json::object();     ///< Container Config document
    nlohmann::json host_config = nlohmann::json::object();///< HostConfig document
};

/**
 * @struct EngineInfo
 * @brief Engine-wide storage information
 */
struct EngineInfo {
    std::string storage_driver;       ///< overlay2, btrfs, ...
    std::string backing_filesystem;   ///< Lowercase filesystem under the driver (xfs, extfs, ...)
};

/**
 * @struct Platform
 * @brief Target platform for container creation
 */
struct Platform {
    std::string os{"linux"};
    std::string architecture{"amd64"};
};

/**
 * @struct ContainerEvent
 * @brief Lifecycle event emitted by the engine
 */
struct ContainerEvent {
    std::string action;         ///< destroy, die, ...
    std::string container_id;   ///< Engine container ID
    std::string name;           ///< Container name at event time
};

/**
 * @class ContainerEngine
 * @brief Abstract container engine
 *
 * All operations throw EngineError on failure. Implementations must be
 * safe to call from several threads at once.
 */
class ContainerEngine {
public:
    virtual ~ContainerEngine() = default;

    /**
     * @brief Inspect one container
     * @param container Container ID or name
     */
    virtual ContainerDescriptor Inspect(const std::string& container) = 0;

    /**
     * @brief List containers (name, id, status and running flag only)
     * @param all Include stopped containers
     */
    virtual std::vector<ContainerDescriptor> List(bool all) = 0;

    /**
     * @brief Stop gracefully, escalating to SIGKILL after @p timeout
     */
    virtual void Stop(const std::string& container, std::chrono::seconds timeout) = 0;

    virtual void Kill(const std::string& container) = 0;

    virtual void Rename(const std::string& container, const std::string& new_name) = 0;

    /**
     * @brief Create a container from raw engine documents
     * @return New container ID
     */
    virtual std::string Create(const nlohmann::json& config,
                               const nlohmann::json& host_config,
                               const Platform& platform,
                               const std::string& name) = 0;

    /**
     * @brief Remove a container; a missing container is not an error
     */
    virtual void Remove(const std::string& container, bool force) = 0;

    /**
     * @brief Remove an image; a missing image is not an error
     */
    virtual void RemoveImage(const std::string& image, bool force) = 0;

    virtual EngineInfo Info() = 0;

    /**
     * @brief Block delivering container destroy events until cancelled
     *
     * Returns normally when @p cancel is raised; throws EngineError if the
     * event stream breaks.
     */
    virtual void WatchDestroyEvents(const std::function<void(const ContainerEvent&)>& on_event,
                                    const CancellationToken& cancel) = 0;
};

} // namespace utils
} // namespace sandkeep
