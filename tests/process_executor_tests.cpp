#include <cassert>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#define private public
#include "execution/process_executor.hpp"
#undef private

#include "core/errors.hpp"
#include "execution/stdio_redirection.hpp"

using lazycmd::ProcessExecutor;
using lazycmd::SpawnError;
using lazycmd::StdioRedirection;
using lazycmd::StreamPolicy;

namespace {

namespace fs = std::filesystem;

std::string make_temp_dir() {
    std::string pattern = "/tmp/lazy_command_process_executor_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    char *created = mkdtemp(buffer.data());
    assert(created != nullptr);
    return created;
}

void write_script(const fs::path &path, std::string_view body, fs::perms perms) {
    std::ofstream file(path);
    assert(file.is_open());
    file << body;
    file.close();

    std::error_code ec;
    fs::permissions(path, perms, fs::perm_options::replace, ec);
    assert(!ec);
}

constexpr auto executable_perms = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec;

void reap_all_children() {
    int status = 0;
    while (waitpid(-1, &status, WNOHANG) > 0) {
    }
}

void test_spawn_and_wait_reports_exit_code() {
    ProcessExecutor executor;
    StdioRedirection stdio(StreamPolicy::Inherit, StreamPolicy::Discard, StreamPolicy::Discard);

    const pid_t pid = executor.spawn({"sh", "-c", "exit 3"}, stdio);
    assert(pid > 0);
    assert(ProcessExecutor::wait_for_process(pid) == 3);
}

void test_spawn_missing_program_throws_with_errno() {
    ProcessExecutor executor;
    StdioRedirection stdio(StreamPolicy::Inherit, StreamPolicy::Capture, StreamPolicy::Inherit);

    bool threw = false;
    try {
        (void)executor.spawn({"definitely_missing_lazy_command_program"}, stdio);
    } catch (const SpawnError &error) {
        threw = true;
        assert(error.code() == ENOENT);
        assert(std::string(error.what()).find("definitely_missing_lazy_command_program") != std::string::npos);
    }
    assert(threw);

    // The failed child has already been reaped.
    int status = 0;
    assert(waitpid(-1, &status, WNOHANG) == -1);
    assert(errno == ECHILD);
}

void test_spawn_non_executable_and_broken_interpreter() {
    const std::string dir = make_temp_dir();
    const fs::path not_executable = fs::path(dir) / "not_executable";
    const fs::path broken = fs::path(dir) / "broken_interpreter";
    write_script(not_executable, "#!/bin/sh\nexit 0\n", fs::perms::owner_read | fs::perms::owner_write);
    write_script(broken, "#!/definitely/missing/interpreter\n", executable_perms);

    ProcessExecutor executor;

    if (geteuid() != 0) {
        StdioRedirection stdio(StreamPolicy::Inherit, StreamPolicy::Inherit, StreamPolicy::Inherit);
        bool threw = false;
        try {
            (void)executor.spawn({not_executable.string()}, stdio);
        } catch (const SpawnError &error) {
            threw = error.code() == EACCES;
        }
        assert(threw);
    }

    {
        StdioRedirection stdio(StreamPolicy::Inherit, StreamPolicy::Inherit, StreamPolicy::Inherit);
        bool threw = false;
        try {
            (void)executor.spawn({broken.string(), "arg"}, stdio);
        } catch (const SpawnError &error) {
            threw = error.code() == ENOENT;
        }
        assert(threw);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_spawn_rejects_invalid_stdio_and_empty_argv() {
    ProcessExecutor executor;

    StdioRedirection stdio(StreamPolicy::Inherit, StreamPolicy::Inherit, StreamPolicy::Inherit);
    bool empty_threw = false;
    try {
        (void)executor.spawn({}, stdio);
    } catch (const SpawnError &) {
        empty_threw = true;
    }
    assert(empty_threw);

    static const lazycmd::StdioSyscalls failing_pipe{
        .pipe_fn = +[](int * /*fds*/) {
            errno = EMFILE;
            return -1;
        },
        .open_fn = +[](const char *path, int flags, unsigned int mode) { return ::open(path, flags, mode); },
        .dup2_fn = +[](int old_fd, int new_fd) { return ::dup2(old_fd, new_fd); },
        .close_fn = +[](int fd) { return ::close(fd); },
    };

    StdioRedirection broken(StreamPolicy::Inherit, StreamPolicy::Capture, StreamPolicy::Inherit, &failing_pipe);
    bool invalid_threw = false;
    try {
        (void)executor.spawn({"true"}, broken);
    } catch (const SpawnError &error) {
        invalid_threw = std::string(error.what()).find("failed to create pipe") != std::string::npos;
    }
    assert(invalid_threw);
}

void test_drain_collects_both_streams_completely() {
    ProcessExecutor executor;
    StdioRedirection stdio(StreamPolicy::Discard, StreamPolicy::Capture, StreamPolicy::Capture);

    // Both streams exceed a pipe buffer, so reading them one after the other
    // would deadlock.
    const pid_t pid = executor.spawn(
        {"sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo out-line; echo err-line >&2; i=$((i+1)); done"}, stdio);
    const auto captured = executor.drain(stdio.parent_fd(STDOUT_FILENO), stdio.parent_fd(STDERR_FILENO));
    assert(ProcessExecutor::wait_for_process(pid) == 0);

    assert(captured.stdout_data.size() == 20000 * std::string("out-line\n").size());
    assert(captured.stderr_data.size() == 20000 * std::string("err-line\n").size());
    assert(captured.stdout_data.find("err-line") == std::string::npos);
}

void test_drain_skips_uncaptured_streams() {
    ProcessExecutor executor;
    const auto captured = executor.drain(-1, -1);
    assert(captured.stdout_data.empty());
    assert(captured.stderr_data.empty());
}

void test_exec_status_pipe_outcomes() {
    {
        int fds[2] = {-1, -1};
        assert(pipe(fds) == 0);
        close(fds[1]);
        assert(ProcessExecutor::read_exec_errno(fds[0]) == 0);
        close(fds[0]);
    }

    {
        int fds[2] = {-1, -1};
        assert(pipe(fds) == 0);
        const int reported = EACCES;
        assert(write(fds[1], &reported, sizeof(reported)) == static_cast<ssize_t>(sizeof(reported)));
        close(fds[1]);
        assert(ProcessExecutor::read_exec_errno(fds[0]) == EACCES);
        close(fds[0]);
    }

    {
        int fds[2] = {-1, -1};
        assert(pipe(fds) == 0);
        const char truncated = 1;
        assert(write(fds[1], &truncated, 1) == 1);
        close(fds[1]);
        assert(ProcessExecutor::read_exec_errno(fds[0]) == EIO);
        close(fds[0]);
    }

    // A failed read must not pass for a successful exec.
    assert(ProcessExecutor::read_exec_errno(-1) == EBADF);
}

void test_private_wait_helpers() {
    {
        const pid_t pid = fork();
        assert(pid != -1);
        if (pid == 0) {
            _exit(7);
        }

        int status = 0;
        assert(waitpid(pid, &status, 0) == pid);
        assert(ProcessExecutor::wait_status_to_exit_code(status) == 7);
    }

    {
        const pid_t pid = fork();
        assert(pid != -1);
        if (pid == 0) {
            raise(SIGTERM);
            _exit(0);
        }

        int status = 0;
        assert(waitpid(pid, &status, 0) == pid);
        assert(ProcessExecutor::wait_status_to_exit_code(status) == -SIGTERM);
    }

    assert(ProcessExecutor::wait_status_to_exit_code(0x7f) == 1);

    {
        const pid_t pid = fork();
        assert(pid != -1);
        if (pid == 0) {
            sleep(2);
            _exit(0);
        }

        struct sigaction action {};
        action.sa_handler = +[](int) {};
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGALRM, &action, nullptr);

        alarm(1);
        assert(ProcessExecutor::wait_for_process(pid) == 0);
        alarm(0);
    }

    reap_all_children();
    bool wait_threw = false;
    try {
        (void)ProcessExecutor::wait_for_process(-1);
    } catch (const std::runtime_error &error) {
        wait_threw = std::string(error.what()).find("waitpid failed") != std::string::npos;
    }
    assert(wait_threw);
}

} // namespace

int main() {
    test_spawn_and_wait_reports_exit_code();
    test_spawn_missing_program_throws_with_errno();
    test_spawn_non_executable_and_broken_interpreter();
    test_spawn_rejects_invalid_stdio_and_empty_argv();
    test_drain_collects_both_streams_completely();
    test_drain_skips_uncaptured_streams();
    test_exec_status_pipe_outcomes();
    test_private_wait_helpers();

    return 0;
}
