#pragma once

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/output.hpp"
#include "core/stream_policy.hpp"

namespace lazycmd {

// Process builder. Configuration calls mutate the builder and return it so
// they can be chained:
//
//     auto out = CommandBuilder("grep -r needle").arg(".").output_pipe().output();
//
// Both terminal calls spawn a fresh child every time they are invoked, so a
// configured builder may be run again.
class CommandBuilder {
  public:
    // Splits the line with POSIX shell quoting rules. Throws
    // ConfigurationError on bad quoting or when no token remains.
    explicit CommandBuilder(std::string_view command_line);
    // Uses argv as is. Throws ConfigurationError if it is empty.
    explicit CommandBuilder(std::vector<std::string> argv);

    CommandBuilder &arg(std::string token);
    CommandBuilder &args(std::span<const std::string> tokens);
    CommandBuilder &args(std::initializer_list<std::string_view> tokens);

    CommandBuilder &stdin_policy(StreamPolicy policy);
    CommandBuilder &stdout_policy(StreamPolicy policy);
    CommandBuilder &stderr_policy(StreamPolicy policy);

    CommandBuilder &stdin_pipe();
    CommandBuilder &stdout_pipe();
    CommandBuilder &stderr_pipe();
    // stdout and stderr.
    CommandBuilder &output_pipe();
    CommandBuilder &all_pipe();

    CommandBuilder &stdin_null();
    CommandBuilder &stdout_null();
    CommandBuilder &stderr_null();
    CommandBuilder &all_null();

    CommandBuilder &stdin_inherit();
    CommandBuilder &stdout_inherit();
    CommandBuilder &stderr_inherit();

    // Captured bytes are returned untouched instead of having their line
    // endings normalized.
    CommandBuilder &binary_mode();

    // Runs the arguments joined by spaces through /bin/sh -c, so shell
    // syntax in them is interpreted.
    CommandBuilder &shell();

    // Runs to completion and returns the status plus every captured stream.
    [[nodiscard]] Output output() const;
    // Runs to completion without reading any pipe. A child that fills a
    // captured pipe blocks; use output() or discard for chatty commands.
    [[nodiscard]] int status() const;

    [[nodiscard]] const std::vector<std::string> &argv() const noexcept { return argv_; }
    [[nodiscard]] StreamPolicy stdin_policy() const noexcept { return stdin_policy_; }
    [[nodiscard]] StreamPolicy stdout_policy() const noexcept { return stdout_policy_; }
    [[nodiscard]] StreamPolicy stderr_policy() const noexcept { return stderr_policy_; }
    [[nodiscard]] bool is_binary() const noexcept { return binary_mode_; }
    [[nodiscard]] bool is_shell() const noexcept { return shell_mode_; }

    // The argument vector the terminal calls execute.
    [[nodiscard]] std::vector<std::string> spawn_argv() const;

  private:
    std::vector<std::string> argv_;
    StreamPolicy stdin_policy_{StreamPolicy::Inherit};
    StreamPolicy stdout_policy_{StreamPolicy::Inherit};
    StreamPolicy stderr_policy_{StreamPolicy::Inherit};
    bool binary_mode_{false};
    bool shell_mode_{false};

    [[nodiscard]] std::string decode(std::string data) const;
};

} // namespace lazycmd
