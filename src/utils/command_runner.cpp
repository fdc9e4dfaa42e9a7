/**
 * @file command_runner.cpp
 * @brief fork/exec implementation of CommandRunner
 *
 * The parent multiplexes the child's stdin, stdout and stderr pipes with
 * poll(2) in 100ms slices, checking the deadline and the cancellation token
 * between slices. Killing targets the child's process group.
 *
 * @date 2025
 */

#include "sandkeep/utils/command_runner.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandkeep {
namespace utils {

namespace {

constexpr int kPollSliceMs = 100;

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void MakePipe(int fds[2]) {
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe2");
    }
}

// Splits buffered stdout into complete lines; the remainder stays buffered.
void DrainLines(std::string& buffer, const std::function<void(const std::string&)>& on_line) {
    std::size_t pos;
    while ((pos = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        on_line(line);
    }
}

} // anonymous namespace

std::string FormatCommandLine(const std::vector<std::string>& argv) {
    std::ostringstream cmd;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) cmd << ' ';
        if (argv[i].find_first_of(" \t\"'") != std::string::npos) {
            cmd << '"' << argv[i] << '"';
        } else {
            cmd << argv[i];
        }
    }
    return cmd.str();
}

SubprocessRunner::SubprocessRunner() {
    // Writing to a child that exited early must surface as EPIPE, not kill us.
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

CommandResult SubprocessRunner::Run(const std::vector<std::string>& argv,
                                    const CommandOptions& options) {
    return Execute(argv, options, nullptr);
}

CommandResult SubprocessRunner::Stream(const std::vector<std::string>& argv,
                                       const std::function<void(const std::string&)>& on_line,
                                       const CommandOptions& options) {
    return Execute(argv, options, &on_line);
}

CommandResult SubprocessRunner::Execute(const std::vector<std::string>& argv,
                                        const CommandOptions& options,
                                        const std::function<void(const std::string&)>* on_line) {
    if (argv.empty()) {
        throw std::invalid_argument("empty command line");
    }

    spdlog::debug("Executing: {}", FormatCommandLine(argv));

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    MakePipe(in_pipe);
    MakePipe(out_pipe);
    MakePipe(err_pipe);

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        for (int* fds : {in_pipe, out_pipe, err_pipe}) {
            CloseFd(fds[0]);
            CloseFd(fds[1]);
        }
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child: own process group, default signal state, pipes on stdio, exec.
        ::setpgid(0, 0);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        const char msg[] = "exec failed\n";
        ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);

    int stdin_fd = in_pipe[1];
    int stdout_fd = out_pipe[0];
    int stderr_fd = err_pipe[0];

    if (options.stdin_data.empty()) {
        CloseFd(stdin_fd);
    } else {
        ::fcntl(stdin_fd, F_SETFL, ::fcntl(stdin_fd, F_GETFL) | O_NONBLOCK);
    }

    CommandResult result;
    std::string line_buffer;
    std::size_t stdin_offset = 0;
    bool killed = false;

    const auto start = std::chrono::steady_clock::now();
    std::array<char, 4096> buffer;

    auto kill_child = [&]() {
        if (!killed) {
            ::kill(-pid, SIGKILL);
            killed = true;
        }
    };

    while (stdout_fd >= 0 || stderr_fd >= 0) {
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        int stdout_index = -1, stderr_index = -1, stdin_index = -1;

        if (stdout_fd >= 0) { stdout_index = count; fds[count++] = {stdout_fd, POLLIN, 0}; }
        if (stderr_fd >= 0) { stderr_index = count; fds[count++] = {stderr_fd, POLLIN, 0}; }
        if (stdin_fd >= 0) { stdin_index = count; fds[count++] = {stdin_fd, POLLOUT, 0}; }

        int ready = ::poll(fds.data(), count, kPollSliceMs);
        if (ready < 0 && errno != EINTR) {
            spdlog::error("poll failed: {}", std::strerror(errno));
            kill_child();
            break;
        }

        if (ready > 0) {
            if (stdin_index >= 0 && (fds[stdin_index].revents & (POLLOUT | POLLERR | POLLHUP))) {
                ssize_t n = ::write(stdin_fd, options.stdin_data.data() + stdin_offset,
                                    options.stdin_data.size() - stdin_offset);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                }
                if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    CloseFd(stdin_fd);
                } else if (stdin_offset >= options.stdin_data.size()) {
                    CloseFd(stdin_fd);
                }
            }

            if (stdout_index >= 0 && (fds[stdout_index].revents & (POLLIN | POLLHUP | POLLERR))) {
                ssize_t n = ::read(stdout_fd, buffer.data(), buffer.size());
                if (n > 0) {
                    if (on_line) {
                        line_buffer.append(buffer.data(), static_cast<std::size_t>(n));
                        DrainLines(line_buffer, *on_line);
                    } else {
                        result.stdout_output.append(buffer.data(), static_cast<std::size_t>(n));
                    }
                } else if (n == 0 || errno != EINTR) {
                    CloseFd(stdout_fd);
                }
            }

            if (stderr_index >= 0 && (fds[stderr_index].revents & (POLLIN | POLLHUP | POLLERR))) {
                ssize_t n = ::read(stderr_fd, buffer.data(), buffer.size());
                if (n > 0) {
                    result.stderr_output.append(buffer.data(), static_cast<std::size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    CloseFd(stderr_fd);
                }
            }
        }

        if (!killed && options.timeout.count() > 0 &&
            std::chrono::steady_clock::now() - start > options.timeout) {
            spdlog::warn("Command timed out after {}ms: {}", options.timeout.count(), argv[0]);
            result.timed_out = true;
            kill_child();
        }

        if (!killed && options.cancel && options.cancel->IsCancelled()) {
            spdlog::debug("Command cancelled: {}", argv[0]);
            result.cancelled = true;
            kill_child();
        }
    }

    CloseFd(stdin_fd);
    CloseFd(stdout_fd);
    CloseFd(stderr_fd);

    if (on_line && !line_buffer.empty()) {
        (*on_line)(line_buffer);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    result.success = (result.exit_code == 0 && !result.timed_out && !result.cancelled);
    return result;
}

} // namespace utils
} // namespace sandkeep
