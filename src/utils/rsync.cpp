/**
 * @file rsync.cpp
 * @brief rsync-backed implementation of the bulk copy primitive
 *
 * Flags:
 * - `-a` archive mode (permissions, ownership, timestamps, symlinks, devices)
 * - `-A` ACLs
 * - `-X` extended attributes
 *
 * @date 2025
 */

#include "sandkeep/utils/rsync.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace sandkeep {
namespace utils {

namespace {

std::string WithTrailingSlash(const std::filesystem::path& path) {
    std::string normalized = path.lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    if (normalized != "/") {
        normalized += '/';
    }
    return normalized;
}

} // anonymous namespace

std::vector<std::string> BuildRsyncArgs(const std::filesystem::path& source,
                                        const std::filesystem::path& destination,
                                        const std::string& rsync_binary) {
    return {rsync_binary, "-aAX", WithTrailingSlash(source), WithTrailingSlash(destination)};
}

CopyResult RsyncCopy(CommandRunner& runner,
                     const std::filesystem::path& source,
                     const std::filesystem::path& destination,
                     std::chrono::seconds timeout,
                     const std::string& rsync_binary) {
    spdlog::debug("rsync copy: {} -> {}", source.string(), destination.string());

    CommandOptions options;
    options.timeout = timeout;

    CopyResult copy;
    CommandResult result;
    try {
        result = runner.Run(BuildRsyncArgs(source, destination, rsync_binary), options);
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to launch rsync: {}", e.what());
        copy.diagnostics = e.what();
        return copy;
    }

    copy.exit_code = result.exit_code;
    copy.timed_out = result.timed_out;

    if (!result.success) {
        copy.diagnostics = StringUtils::Trim(result.stderr_output);
        if (result.timed_out) {
            copy.diagnostics = "rsync timed out after " + std::to_string(timeout.count()) + "s" +
                               (copy.diagnostics.empty() ? "" : ": " + copy.diagnostics);
        }
        if (!copy.diagnostics.empty()) {
            spdlog::error("rsync stderr: {}", copy.diagnostics);
        }
        spdlog::error("rsync failed with exit code {}", result.exit_code);
        return copy;
    }

    std::string output = StringUtils::Trim(result.stdout_output);
    if (!output.empty()) {
        spdlog::debug("rsync output: {}", output);
    }

    spdlog::info("Successfully completed rsync copy");
    copy.success = true;
    return copy;
}

} // namespace utils
} // namespace sandkeep
