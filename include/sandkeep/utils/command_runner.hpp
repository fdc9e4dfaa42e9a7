/**
 * @file command_runner.hpp
 * @brief External command execution with output capture, timeouts and cancellation
 *
 * Every interaction with host tooling (docker CLI, curl against the engine
 * socket, rsync) goes through the CommandRunner interface so the adapters
 * built on top of it can be driven by scripted runners in tests.
 *
 * @date 2025
 */

#pragma once

#include "sandkeep/utils/cancellation.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace sandkeep {
namespace utils {

/**
 * @struct CommandOptions
 * @brief Per-invocation execution settings
 */
struct CommandOptions {
    std::chrono::milliseconds timeout{0};        ///< Kill the command after this long (0 = unbounded)
    std::string stdin_data;                      ///< Bytes written to the child's stdin
    const CancellationToken* cancel{nullptr};    ///< Kill the command when cancelled
};

/**
 * @struct CommandResult
 * @brief Outcome of a finished command
 */
struct CommandResult {
    int exit_code{-1};             ///< Exit status (128 + signal when killed)
    std::string stdout_output;     ///< Captured standard output
    std::string stderr_output;     ///< Captured standard error
    bool timed_out{false};         ///< Killed because the timeout expired
    bool cancelled{false};         ///< Killed because the token was cancelled
    bool success{false};           ///< exit_code == 0 and not killed
};

/**
 * @class CommandRunner
 * @brief Abstract command executor
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command to completion and capture its output
     * @param argv Program and arguments (argv[0] is looked up in PATH)
     * @param options Timeout, stdin and cancellation settings
     * @return Exit status and captured output
     */
    virtual CommandResult Run(const std::vector<std::string>& argv,
                              const CommandOptions& options) = 0;

    /**
     * @brief Run a long-lived command, delivering stdout line by line
     *
     * Blocks until the command exits or @p options.cancel is raised; stderr
     * is still captured into the returned result.
     */
    virtual CommandResult Stream(const std::vector<std::string>& argv,
                                 const std::function<void(const std::string&)>& on_line,
                                 const CommandOptions& options) = 0;
};

/**
 * @class SubprocessRunner
 * @brief CommandRunner backed by fork/exec
 *
 * Each command runs in its own process group so a timeout or cancellation
 * kills the whole tree (rsync forks a receiver, for example).
 */
class SubprocessRunner : public CommandRunner {
public:
    SubprocessRunner();

    CommandResult Run(const std::vector<std::string>& argv,
                      const CommandOptions& options) override;

    CommandResult Stream(const std::vector<std::string>& argv,
                         const std::function<void(const std::string&)>& on_line,
                         const CommandOptions& options) override;

private:
    CommandResult Execute(const std::vector<std::string>& argv,
                          const CommandOptions& options,
                          const std::function<void(const std::string&)>* on_line);
};

/**
 * @brief Render argv as a single shell-like string for log lines
 */
std::string FormatCommandLine(const std::vector<std::string>& argv);

} // namespace utils
} // namespace sandkeep
