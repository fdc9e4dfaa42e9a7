/**
 * @file rsync.hpp
 * @brief Bulk directory-tree copy with full attribute preservation
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/utils/command_runner.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace sandkeep {
namespace utils {

/**
 * @struct CopyResult
 * @brief Outcome of a bulk copy
 */
struct CopyResult {
    bool success{false};        ///< Copy finished with exit code 0
    bool timed_out{false};      ///< Copy killed at the deadline
    int exit_code{-1};          ///< Tool exit code
    std::string diagnostics;    ///< Tool stderr (or a description of the failure)
};

/**
 * @brief Copy the contents of @p source onto @p destination with rsync -aAX
 *
 * Permissions, ownership, timestamps, symlinks, devices, ACLs and extended
 * attributes are preserved. Both paths get a trailing slash so the
 * directory contents are copied rather than the directory itself.
 *
 * @param runner Command runner used to spawn rsync
 * @param source Directory to read
 * @param destination Directory to write into (must exist)
 * @param timeout Upper bound for the whole copy; the tool is killed on expiry
 * @param rsync_binary rsync executable name or path
 * @return CopyResult with the tool's diagnostics on failure
 */
CopyResult RsyncCopy(CommandRunner& runner,
                     const std::filesystem::path& source,
                     const std::filesystem::path& destination,
                     std::chrono::seconds timeout,
                     const std::string& rsync_binary = "rsync");

/**
 * @brief Build the rsync argument vector used by RsyncCopy
 */
std::vector<std::string> BuildRsyncArgs(const std::filesystem::path& source,
                                        const std::filesystem::path& destination,
                                        const std::string& rsync_binary = "rsync");

} // namespace utils
} // namespace sandkeep
