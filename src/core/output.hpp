#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace lazycmd {

// Result of CommandBuilder::output(). A stream that was not configured for
// capture stays disengaged.
struct Output {
    int status{0};
    std::optional<std::string> stdout_text;
    std::optional<std::string> stderr_text;

    [[nodiscard]] bool is_success() const noexcept { return status == 0; }
    explicit operator bool() const noexcept { return is_success(); }
};

std::ostream &operator<<(std::ostream &out, const Output &output);

// Converts "\r\n" and lone '\r' to '\n'.
[[nodiscard]] std::string normalize_newlines(std::string_view text);

} // namespace lazycmd
