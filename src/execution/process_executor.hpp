#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

namespace lazycmd {

class StdioRedirection;

struct CapturedStreams {
    std::string stdout_data;
    std::string stderr_data;
};

class ProcessExecutor {
  public:
    // Starts argv[0] (looked up in PATH) with the given stdio. Throws
    // SpawnError if the program could not be executed; the child is reaped
    // before the exception leaves.
    [[nodiscard]] pid_t spawn(const std::vector<std::string> &argv, StdioRedirection &stdio) const;

    // Reads both descriptors until end of file. Pass -1 for a stream that is
    // not captured.
    [[nodiscard]] CapturedStreams drain(int stdout_fd, int stderr_fd) const;

    [[nodiscard]] static int wait_for_process(pid_t pid);

  private:
    [[noreturn]] static void exec_in_child(
        const std::vector<char *> &argv, const StdioRedirection &stdio, int error_fd) noexcept;
    [[noreturn]] static void report_errno_and_exit(int error_fd) noexcept;
    // 0 once exec closed the status pipe, otherwise the reason the spawn failed.
    [[nodiscard]] static int read_exec_errno(int fd) noexcept;

    [[nodiscard]] static int wait_status_to_exit_code(int status);
};

} // namespace lazycmd
