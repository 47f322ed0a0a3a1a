#pragma once

#include <stdexcept>
#include <string>

namespace lazycmd {

// Thrown while building a command, before anything is spawned.
class ConfigurationError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// Thrown by a terminal call when the child process could not be started.
class SpawnError : public std::runtime_error {
  public:
    explicit SpawnError(const std::string &message, int code = 0) : std::runtime_error(message), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

  private:
    int code_;
};

} // namespace lazycmd
