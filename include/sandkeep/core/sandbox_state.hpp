/**
 * @file sandbox_state.hpp
 * @brief Sandbox lifecycle states and their string forms
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>

namespace sandkeep {
namespace core {

/**
 * @enum SandboxState
 * @brief Last-known lifecycle state of a sandbox
 */
enum class SandboxState {
    UNKNOWN,           ///< Not determinable from the engine
    CREATING,          ///< Container being created
    RESTORING,         ///< Being restored from a backup
    STARTING,          ///< Start requested, not yet running
    STARTED,           ///< Running
    STOPPING,          ///< Stop requested, not yet stopped
    STOPPED,           ///< Container exists and is not running
    RESIZING,          ///< Resources being changed
    DESTROYING,        ///< Removal in progress
    DESTROYED,         ///< Container removed (terminal)
    ERROR,             ///< Engine reports the container as broken
    PULLING_SNAPSHOT   ///< Base image being pulled
};

/**
 * @struct SandboxStateRecord
 * @brief One cached state entry, owned by StateStore
 */
struct SandboxStateRecord {
    std::string sandbox_id;
    SandboxState state{SandboxState::UNKNOWN};
    std::chrono::system_clock::time_point last_updated;
};

std::string SandboxStateToString(SandboxState state);

/**
 * @brief Parse a state name; unrecognized names map to UNKNOWN
 */
SandboxState SandboxStateFromString(const std::string& value);

/**
 * @brief True for states after which a record may be pruned
 */
bool IsTerminalState(SandboxState state);

/**
 * @brief Map an engine container status (running, exited, ...) to a sandbox state
 */
SandboxState SandboxStateFromContainerStatus(const std::string& status);

} // namespace core
} // namespace sandkeep
