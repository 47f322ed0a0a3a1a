#include "core/tokenizer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace lazycmd {

namespace {

[[nodiscard]] bool escapable_in_double_quotes(char c) noexcept {
    return c == '\\' || c == '"' || c == '$' || c == '`' || c == '\n';
}

} // namespace

std::expected<std::vector<std::string>, TokenizeError> Tokenizer::tokenize(std::string_view input) const {
    std::vector<std::string> tokens;
    std::string token;

    bool single_quoted = false;
    bool double_quoted = false;
    bool escaped = false;
    // Set once a quote opens, so that '' and "" still yield an (empty) token.
    bool token_started = false;

    auto flush_token = [&]() {
        if (token_started) {
            tokens.push_back(std::move(token));
            token.clear();
            token_started = false;
        }
    };

    for (const char current : input) {
        if (escaped) {
            escaped = false;

            if (current == '\n') {
                continue;
            }

            if (double_quoted && !escapable_in_double_quotes(current)) {
                token.push_back('\\');
            }
            token.push_back(current);
            token_started = true;
            continue;
        }

        if (single_quoted) {
            if (current == '\'') {
                single_quoted = false;
            } else {
                token.push_back(current);
            }
            continue;
        }

        if (current == '\\') {
            escaped = true;
            continue;
        }

        if (current == '"') {
            double_quoted = !double_quoted;
            token_started = true;
            continue;
        }

        if (double_quoted) {
            token.push_back(current);
            continue;
        }

        if (current == '\'') {
            single_quoted = true;
            token_started = true;
            continue;
        }

        if (std::isspace(static_cast<unsigned char>(current))) {
            flush_token();
            continue;
        }

        token.push_back(current);
        token_started = true;
    }

    if (single_quoted) {
        return std::unexpected(TokenizeError{"unterminated single quote"});
    }

    if (double_quoted) {
        return std::unexpected(TokenizeError{"unterminated double quote"});
    }

    if (escaped) {
        return std::unexpected(TokenizeError{"no character to escape after trailing backslash"});
    }

    flush_token();
    return tokens;
}

} // namespace lazycmd
