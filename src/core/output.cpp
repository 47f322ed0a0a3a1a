#include "core/output.hpp"

#include <iomanip>
#include <ostream>

namespace lazycmd {

namespace {

void print_stream(std::ostream &out, const std::optional<std::string> &text) {
    if (text.has_value()) {
        out << std::quoted(*text);
    } else {
        out << "None";
    }
}

} // namespace

std::ostream &operator<<(std::ostream &out, const Output &output) {
    out << "Output(code=" << output.status << ", stdout=";
    print_stream(out, output.stdout_text);
    out << ", stderr=";
    print_stream(out, output.stderr_text);
    return out << ')';
}

std::string normalize_newlines(std::string_view text) {
    std::string normalized;
    normalized.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\r') {
            normalized.push_back(text[i]);
            continue;
        }

        normalized.push_back('\n');
        if (i + 1 < text.size() && text[i + 1] == '\n') {
            ++i;
        }
    }

    return normalized;
}

} // namespace lazycmd
