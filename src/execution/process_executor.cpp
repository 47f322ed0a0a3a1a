#include "execution/process_executor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/errors.hpp"
#include "execution/stdio_redirection.hpp"

namespace lazycmd {

namespace {

[[nodiscard]] std::vector<char *> build_argv(const std::vector<std::string> &args) {
    std::vector<char *> argv;
    argv.reserve(args.size() + 1);

    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    return argv;
}

void close_quietly(int fd) noexcept {
    if (fd != -1) {
        close(fd);
    }
}

} // namespace

pid_t ProcessExecutor::spawn(const std::vector<std::string> &argv, StdioRedirection &stdio) const {
    if (argv.empty()) {
        throw SpawnError("empty argument vector");
    }

    const std::string &program = argv.front();

    if (!stdio.is_valid()) {
        throw SpawnError(program + ": " + stdio.error());
    }

    auto c_argv = build_argv(argv);

    // Closed by a successful exec; otherwise carries the child's errno.
    int error_pipe[2] = {-1, -1};
    if (pipe2(error_pipe, O_CLOEXEC) == -1) {
        const int error = errno;
        throw SpawnError(program + ": failed to create exec status pipe: " + std::strerror(error), error);
    }

    const pid_t pid = fork();
    if (pid == -1) {
        const int error = errno;
        close_quietly(error_pipe[0]);
        close_quietly(error_pipe[1]);
        throw SpawnError(program + ": fork failed: " + std::strerror(error), error);
    }

    if (pid == 0) {
        close(error_pipe[0]);
        exec_in_child(c_argv, stdio, error_pipe[1]);
    }

    close_quietly(error_pipe[1]);
    stdio.close_child_ends();

    const int exec_errno = read_exec_errno(error_pipe[0]);
    close_quietly(error_pipe[0]);

    if (exec_errno != 0) {
        (void)wait_for_process(pid);
        throw SpawnError(program + ": " + std::strerror(exec_errno), exec_errno);
    }

    return pid;
}

int ProcessExecutor::read_exec_errno(int fd) noexcept {
    int child_errno = 0;
    ssize_t bytes_read = 0;
    while ((bytes_read = read(fd, &child_errno, sizeof(child_errno))) == -1 && errno == EINTR) {
    }

    if (bytes_read == 0) {
        return 0;
    }

    if (bytes_read < 0) {
        // Without the status the spawn cannot be trusted.
        return errno;
    }

    return bytes_read == static_cast<ssize_t>(sizeof(child_errno)) && child_errno != 0 ? child_errno : EIO;
}

CapturedStreams ProcessExecutor::drain(int stdout_fd, int stderr_fd) const {
    CapturedStreams captured;

    std::array<pollfd, 2> fds{{
        {.fd = stdout_fd, .events = POLLIN, .revents = 0},
        {.fd = stderr_fd, .events = POLLIN, .revents = 0},
    }};
    std::array<std::string *, 2> sinks{&captured.stdout_data, &captured.stderr_data};
    std::array<char, 4096> buffer{};

    auto open_count = [&fds]() {
        return static_cast<nfds_t>((fds[0].fd >= 0 ? 1 : 0) + (fds[1].fd >= 0 ? 1 : 0));
    };

    while (open_count() > 0) {
        if (poll(fds.data(), fds.size(), -1) == -1) {
            const int error = errno;
            if (error == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(error));
        }

        for (std::size_t i = 0; i < fds.size(); ++i) {
            auto &entry = fds[i];
            if (entry.fd < 0 || entry.revents == 0) {
                continue;
            }

            if ((entry.revents & POLLNVAL) != 0) {
                entry.fd = -1;
                continue;
            }

            const ssize_t count = read(entry.fd, buffer.data(), buffer.size());
            if (count > 0) {
                sinks[i]->append(buffer.data(), static_cast<std::size_t>(count));
            } else if (count == 0) {
                // Negative descriptors are ignored by poll.
                entry.fd = -1;
            } else if (const int error = errno; error != EINTR && error != EAGAIN) {
                throw std::runtime_error(std::string("read failed: ") + std::strerror(error));
            }
        }
    }

    return captured;
}

void ProcessExecutor::exec_in_child(
    const std::vector<char *> &argv, const StdioRedirection &stdio, int error_fd) noexcept {
    if (!stdio.apply_in_child()) {
        report_errno_and_exit(error_fd);
    }

    execvp(argv.front(), argv.data());
    report_errno_and_exit(error_fd);
}

void ProcessExecutor::report_errno_and_exit(int error_fd) noexcept {
    const int error = errno;
    const ssize_t written = write(error_fd, &error, sizeof(error));
    _exit(written == static_cast<ssize_t>(sizeof(error)) ? 127 : 126);
}

int ProcessExecutor::wait_for_process(pid_t pid) {
    int status = 0;

    while (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        throw std::runtime_error("waitpid failed");
    }

    return wait_status_to_exit_code(status);
}

int ProcessExecutor::wait_status_to_exit_code(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }

    return 1;
}

} // namespace lazycmd
