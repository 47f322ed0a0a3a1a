#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace lazycmd {

struct TokenizeError {
    std::string message;
};

class Tokenizer {
  public:
    [[nodiscard]] std::expected<std::vector<std::string>, TokenizeError> tokenize(std::string_view input) const;
};

} // namespace lazycmd
