#include "execution/stdio_redirection.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <fcntl.h>
#include <unistd.h>

namespace lazycmd {

namespace {

int posix_pipe(int fds[2]) { return pipe2(fds, O_CLOEXEC); }

int posix_open(const char *path, int flags, unsigned int mode) { return open(path, flags, mode); }

int posix_dup2(int old_fd, int new_fd) { return dup2(old_fd, new_fd); }

int posix_close(int fd) { return close(fd); }

const StdioSyscalls default_syscalls{
    .pipe_fn = &posix_pipe,
    .open_fn = &posix_open,
    .dup2_fn = &posix_dup2,
    .close_fn = &posix_close,
};

constexpr const char *null_device = "/dev/null";

[[nodiscard]] const char *stream_name(int target_fd) {
    switch (target_fd) {
    case STDIN_FILENO:
        return "stdin";
    case STDOUT_FILENO:
        return "stdout";
    case STDERR_FILENO:
        return "stderr";
    }

    return "stream";
}

} // namespace

StdioRedirection::StdioRedirection(
    StreamPolicy stdin_policy,
    StreamPolicy stdout_policy,
    StreamPolicy stderr_policy,
    const StdioSyscalls *syscalls)
    : endpoints_{{
          {.target_fd = STDIN_FILENO, .policy = stdin_policy},
          {.target_fd = STDOUT_FILENO, .policy = stdout_policy},
          {.target_fd = STDERR_FILENO, .policy = stderr_policy},
      }},
      syscalls_(syscalls != nullptr ? syscalls : &default_syscalls) {
    for (auto &endpoint : endpoints_) {
        if (!acquire(endpoint)) {
            valid_ = false;
            release();
            return;
        }
    }
}

StdioRedirection::~StdioRedirection() { release(); }

bool StdioRedirection::is_valid() const noexcept { return valid_; }

const std::string &StdioRedirection::error() const noexcept { return error_; }

bool StdioRedirection::acquire(Endpoint &endpoint) {
    const bool is_input = endpoint.target_fd == STDIN_FILENO;

    switch (endpoint.policy) {
    case StreamPolicy::Inherit:
        return true;

    case StreamPolicy::Capture: {
        int fds[2] = {-1, -1};
        if (syscalls_->pipe_fn(fds) == -1) {
            const int error = errno;
            error_ = std::string("failed to create pipe for ") + stream_name(endpoint.target_fd) + ": " + std::strerror(error);
            return false;
        }

        endpoint.child_fd = is_input ? fds[0] : fds[1];
        endpoint.parent_fd = is_input ? fds[1] : fds[0];
        return true;
    }

    case StreamPolicy::Discard: {
        const int flags = (is_input ? O_RDONLY : O_WRONLY) | O_CLOEXEC;
        const int fd = syscalls_->open_fn(null_device, flags, 0);
        if (fd == -1) {
            const int error = errno;
            error_ = std::string("failed to open '") + null_device + "' for " + stream_name(endpoint.target_fd) + ": " +
                     std::strerror(error);
            return false;
        }

        endpoint.child_fd = fd;
        return true;
    }
    }

    error_ = std::string("unknown policy for ") + stream_name(endpoint.target_fd);
    return false;
}

bool StdioRedirection::apply_in_child() const noexcept {
    for (const auto &endpoint : endpoints_) {
        if (endpoint.child_fd == -1) {
            continue;
        }

        if (endpoint.child_fd == endpoint.target_fd) {
            // dup2 onto itself would keep FD_CLOEXEC set.
            const int flags = fcntl(endpoint.child_fd, F_GETFD);
            if (flags == -1 || fcntl(endpoint.child_fd, F_SETFD, flags & ~FD_CLOEXEC) == -1) {
                return false;
            }
            continue;
        }

        if (syscalls_->dup2_fn(endpoint.child_fd, endpoint.target_fd) == -1) {
            return false;
        }
    }

    return true;
}

void StdioRedirection::close_child_ends() noexcept {
    for (auto &endpoint : endpoints_) {
        close_fd(endpoint.child_fd);
    }
}

int StdioRedirection::parent_fd(int target_fd) const noexcept {
    const Endpoint *endpoint = find_endpoint(target_fd);
    return endpoint != nullptr ? endpoint->parent_fd : -1;
}

void StdioRedirection::close_parent_fd(int target_fd) noexcept {
    for (auto &endpoint : endpoints_) {
        if (endpoint.target_fd == target_fd) {
            close_fd(endpoint.parent_fd);
        }
    }
}

void StdioRedirection::release() noexcept {
    for (auto &endpoint : endpoints_) {
        close_fd(endpoint.child_fd);
        close_fd(endpoint.parent_fd);
    }
}

void StdioRedirection::close_fd(int &fd) noexcept {
    if (fd != -1) {
        syscalls_->close_fn(fd);
        fd = -1;
    }
}

const StdioRedirection::Endpoint *StdioRedirection::find_endpoint(int target_fd) const noexcept {
    for (const auto &endpoint : endpoints_) {
        if (endpoint.target_fd == target_fd) {
            return &endpoint;
        }
    }

    return nullptr;
}

} // namespace lazycmd
