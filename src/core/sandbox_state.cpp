/**
 * @file sandbox_state.cpp
 * @brief Sandbox state conversions
 *
 * @date 2025
 */

#include "sandkeep/core/sandbox_state.hpp"
#include "sandkeep/utils/string_utils.hpp"

namespace sandkeep {
namespace core {

std::string SandboxStateToString(SandboxState state) {
    switch (state) {
        case SandboxState::CREATING: return "creating";
        case SandboxState::RESTORING: return "restoring";
        case SandboxState::STARTING: return "starting";
        case SandboxState::STARTED: return "started";
        case SandboxState::STOPPING: return "stopping";
        case SandboxState::STOPPED: return "stopped";
        case SandboxState::RESIZING: return "resizing";
        case SandboxState::DESTROYING: return "destroying";
        case SandboxState::DESTROYED: return "destroyed";
        case SandboxState::ERROR: return "error";
        case SandboxState::PULLING_SNAPSHOT: return "pulling_snapshot";
        default: return "unknown";
    }
}

SandboxState SandboxStateFromString(const std::string& value) {
    std::string state = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));

    if (state == "creating") return SandboxState::CREATING;
    if (state == "restoring") return SandboxState::RESTORING;
    if (state == "starting") return SandboxState::STARTING;
    if (state == "started") return SandboxState::STARTED;
    if (state == "stopping") return SandboxState::STOPPING;
    if (state == "stopped") return SandboxState::STOPPED;
    if (state == "resizing") return SandboxState::RESIZING;
    if (state == "destroying") return SandboxState::DESTROYING;
    if (state == "destroyed") return SandboxState::DESTROYED;
    if (state == "error") return SandboxState::ERROR;
    if (state == "pulling_snapshot") return SandboxState::PULLING_SNAPSHOT;
    return SandboxState::UNKNOWN;
}

bool IsTerminalState(SandboxState state) {
    return state == SandboxState::DESTROYED;
}

SandboxState SandboxStateFromContainerStatus(const std::string& status) {
    std::string s = utils::StringUtils::ToLower(status);

    if (s == "running") return SandboxState::STARTED;
    if (s == "restarting") return SandboxState::STARTING;
    if (s == "paused" || s == "created" || s == "exited") return SandboxState::STOPPED;
    if (s == "removing") return SandboxState::DESTROYING;
    if (s == "dead") return SandboxState::ERROR;
    return SandboxState::UNKNOWN;
}

} // namespace core
} // namespace sandkeep
