#pragma once

#include <array>
#include <string>

#include "core/stream_policy.hpp"

namespace lazycmd {

struct StdioSyscalls {
    int (*pipe_fn)(int fds[2]);
    int (*open_fn)(const char *path, int flags, unsigned int mode);
    int (*dup2_fn)(int old_fd, int new_fd);
    int (*close_fn)(int fd);
};

// Descriptors backing the three standard streams of one child process.
// Captured streams get a pipe, discarded streams get /dev/null, inherited
// streams get nothing. Every descriptor is close-on-exec and released on
// destruction.
class StdioRedirection {
  public:
    StdioRedirection(
        StreamPolicy stdin_policy,
        StreamPolicy stdout_policy,
        StreamPolicy stderr_policy,
        const StdioSyscalls *syscalls = nullptr);
    ~StdioRedirection();

    StdioRedirection(const StdioRedirection &) = delete;
    StdioRedirection &operator=(const StdioRedirection &) = delete;

    [[nodiscard]] bool is_valid() const noexcept;
    [[nodiscard]] const std::string &error() const noexcept;

    // Runs in the forked child: wires the child ends onto fds 0, 1 and 2.
    [[nodiscard]] bool apply_in_child() const noexcept;
    void close_child_ends() noexcept;

    // Write end for stdin, read end for stdout/stderr; -1 unless captured.
    [[nodiscard]] int parent_fd(int target_fd) const noexcept;
    void close_parent_fd(int target_fd) noexcept;

  private:
    struct Endpoint {
        int target_fd;
        StreamPolicy policy;
        int child_fd{-1};
        int parent_fd{-1};
    };

    std::array<Endpoint, 3> endpoints_;
    bool valid_{true};
    std::string error_;
    const StdioSyscalls *syscalls_;

    [[nodiscard]] bool acquire(Endpoint &endpoint);
    void release() noexcept;
    void close_fd(int &fd) noexcept;
    [[nodiscard]] const Endpoint *find_endpoint(int target_fd) const noexcept;
};

} // namespace lazycmd
