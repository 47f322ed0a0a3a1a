#include "core/command_builder.hpp"

#include <string>
#include <utility>

#include <unistd.h>

#include "core/errors.hpp"
#include "core/tokenizer.hpp"
#include "execution/process_executor.hpp"
#include "execution/stdio_redirection.hpp"

namespace lazycmd {

namespace {

constexpr const char *shell_path = "/bin/sh";

[[nodiscard]] std::vector<std::string> tokenize_command_line(std::string_view command_line) {
    auto tokens = Tokenizer{}.tokenize(command_line);
    if (!tokens.has_value()) {
        throw ConfigurationError("cannot parse command '" + std::string(command_line) + "': " + tokens.error().message);
    }

    return std::move(tokens).value();
}

} // namespace

CommandBuilder::CommandBuilder(std::string_view command_line) : argv_(tokenize_command_line(command_line)) {
    if (argv_.empty()) {
        throw ConfigurationError("command line contains no program");
    }
}

CommandBuilder::CommandBuilder(std::vector<std::string> argv) : argv_(std::move(argv)) {
    if (argv_.empty()) {
        throw ConfigurationError("argument vector contains no program");
    }
}

CommandBuilder &CommandBuilder::arg(std::string token) {
    argv_.push_back(std::move(token));
    return *this;
}

CommandBuilder &CommandBuilder::args(std::span<const std::string> tokens) {
    argv_.insert(argv_.end(), tokens.begin(), tokens.end());
    return *this;
}

CommandBuilder &CommandBuilder::args(std::initializer_list<std::string_view> tokens) {
    for (const auto token : tokens) {
        argv_.emplace_back(token);
    }
    return *this;
}

CommandBuilder &CommandBuilder::stdin_policy(StreamPolicy policy) {
    stdin_policy_ = policy;
    return *this;
}

CommandBuilder &CommandBuilder::stdout_policy(StreamPolicy policy) {
    stdout_policy_ = policy;
    return *this;
}

CommandBuilder &CommandBuilder::stderr_policy(StreamPolicy policy) {
    stderr_policy_ = policy;
    return *this;
}

CommandBuilder &CommandBuilder::stdin_pipe() { return stdin_policy(StreamPolicy::Capture); }

CommandBuilder &CommandBuilder::stdout_pipe() { return stdout_policy(StreamPolicy::Capture); }

CommandBuilder &CommandBuilder::stderr_pipe() { return stderr_policy(StreamPolicy::Capture); }

CommandBuilder &CommandBuilder::output_pipe() { return stdout_pipe().stderr_pipe(); }

CommandBuilder &CommandBuilder::all_pipe() { return stdin_pipe().stdout_pipe().stderr_pipe(); }

CommandBuilder &CommandBuilder::stdin_null() { return stdin_policy(StreamPolicy::Discard); }

CommandBuilder &CommandBuilder::stdout_null() { return stdout_policy(StreamPolicy::Discard); }

CommandBuilder &CommandBuilder::stderr_null() { return stderr_policy(StreamPolicy::Discard); }

CommandBuilder &CommandBuilder::all_null() { return stdin_null().stdout_null().stderr_null(); }

CommandBuilder &CommandBuilder::stdin_inherit() { return stdin_policy(StreamPolicy::Inherit); }

CommandBuilder &CommandBuilder::stdout_inherit() { return stdout_policy(StreamPolicy::Inherit); }

CommandBuilder &CommandBuilder::stderr_inherit() { return stderr_policy(StreamPolicy::Inherit); }

CommandBuilder &CommandBuilder::binary_mode() {
    binary_mode_ = true;
    return *this;
}

CommandBuilder &CommandBuilder::shell() {
    shell_mode_ = true;
    return *this;
}

std::vector<std::string> CommandBuilder::spawn_argv() const {
    if (!shell_mode_) {
        return argv_;
    }

    std::string script;
    for (const auto &token : argv_) {
        if (!script.empty()) {
            script.push_back(' ');
        }
        script += token;
    }

    return {shell_path, "-c", std::move(script)};
}

Output CommandBuilder::output() const {
    StdioRedirection stdio(stdin_policy_, stdout_policy_, stderr_policy_);
    const ProcessExecutor executor;

    const pid_t pid = executor.spawn(spawn_argv(), stdio);
    // The child reads end of file from a captured stdin.
    stdio.close_parent_fd(STDIN_FILENO);

    CapturedStreams captured;
    try {
        captured = executor.drain(stdio.parent_fd(STDOUT_FILENO), stdio.parent_fd(STDERR_FILENO));
    } catch (...) {
        stdio.close_parent_fd(STDOUT_FILENO);
        stdio.close_parent_fd(STDERR_FILENO);
        (void)ProcessExecutor::wait_for_process(pid);
        throw;
    }

    Output result;
    result.status = ProcessExecutor::wait_for_process(pid);

    if (stdout_policy_ == StreamPolicy::Capture) {
        result.stdout_text = decode(std::move(captured.stdout_data));
    }

    if (stderr_policy_ == StreamPolicy::Capture) {
        result.stderr_text = decode(std::move(captured.stderr_data));
    }

    return result;
}

int CommandBuilder::status() const {
    StdioRedirection stdio(stdin_policy_, stdout_policy_, stderr_policy_);
    const ProcessExecutor executor;

    const pid_t pid = executor.spawn(spawn_argv(), stdio);
    stdio.close_parent_fd(STDIN_FILENO);

    return ProcessExecutor::wait_for_process(pid);
}

std::string CommandBuilder::decode(std::string data) const {
    if (binary_mode_) {
        return data;
    }

    return normalize_newlines(data);
}

} // namespace lazycmd
