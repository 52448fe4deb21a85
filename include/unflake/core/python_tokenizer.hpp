#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace unflake {

enum class TokenType {
    NAME,
    NUMBER,
    STRING,
    OP,
    COMMENT,
    NEWLINE,    // End of a logical line
    NL,         // Non-logical line break (blank line, comment line, inside brackets)
    INDENT,
    DEDENT,
    ENDMARKER
};

struct Token {
    TokenType type{};
    std::string text;
    size_t row{};       // 1-based row where the token starts
    std::string line;   // Physical line(s) the token was read from
};

class TokenizeError : public std::runtime_error {
public:
    TokenizeError(const std::string& message, size_t row);

    auto row() const -> size_t { return row_; }

private:
    size_t row_;
};

// Tokenizes Python source the way the reference tokenizer module does,
// throwing TokenizeError where it would raise.
auto tokenize(std::string_view source) -> std::vector<Token>;

// NAME, NUMBER and STRING
auto is_atom(TokenType type) -> bool;

auto token_type_name(TokenType type) -> std::string;

} // namespace unflake
