#include "unflake/core/python_tokenizer.hpp"
#include "unflake/core/source_text.hpp"
#include "unflake/core/text_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>

namespace unflake {

TokenizeError::TokenizeError(const std::string& message, size_t row)
    : std::runtime_error("line " + std::to_string(row) + ": " + message), row_(row) {}

namespace {

// Longest operators first so that "**=" wins over "**" and "*"
constexpr std::array<std::string_view, 24> multi_char_operators = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", ">>", "<<", "<=", ">=",
    "==",  "!=",  "+=",  "-=",  "*=",  "/=", "%=", "&=", "|=", "^=", "@="};

constexpr std::string_view single_char_operators = "+-*/%&|^~<>()[]{},:;.=@";

auto is_string_prefix(std::string_view prefix) -> bool {
    std::string lowered(prefix);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "r" || lowered == "u" || lowered == "b" || lowered == "f" || lowered == "br"
           || lowered == "rb" || lowered == "fr" || lowered == "rf";
}

auto is_quote(char c) -> bool {
    return c == '\'' || c == '"';
}

auto is_line_break(std::string_view line, size_t pos) -> bool {
    return line[pos] == '\n' || (line[pos] == '\r' && (pos + 1 == line.size() || line[pos + 1] == '\n'));
}

// A backslash immediately before the line terminator
auto ends_with_backslash_newline(std::string_view line) -> bool {
    if (line.ends_with("\\\r\n")) {
        return true;
    }
    return line.ends_with("\\\n");
}

auto closing_bracket_for(char open) -> char {
    switch (open) {
    case '(':
        return ')';
    case '[':
        return ']';
    default:
        return '}';
    }
}

class Tokenizer {
public:
    explicit Tokenizer(std::string_view source) : lines_(split_source(source).lines) {}

    auto run() -> std::vector<Token> {
        for (row_ = 1; row_ <= lines_.size(); ++row_) {
            process_line(lines_[row_ - 1]);
        }
        finish();
        return std::move(tokens_);
    }

private:
    std::vector<std::string> lines_;
    std::vector<Token> tokens_;
    std::vector<size_t> indents_{0};
    std::string brackets_;
    size_t row_ = 0;
    bool continued_ = false;

    // State of a string literal that spans physical lines
    bool in_string_ = false;
    std::string string_quote_;
    size_t string_start_row_ = 0;
    std::string string_text_;
    std::string string_lines_;

    auto emit(TokenType type, std::string text, size_t row, std::string line) -> void {
        tokens_.push_back(
            Token{.type = type, .text = std::move(text), .row = row, .line = std::move(line)});
    }

    auto process_line(const std::string& line) -> void {
        size_t pos = 0;

        if (in_string_) {
            auto end = find_string_end(line, 0, string_quote_);
            if (end != std::string::npos) {
                string_text_ += line.substr(0, end);
                string_lines_ += line;
                emit(TokenType::STRING, std::move(string_text_), string_start_row_,
                     std::move(string_lines_));
                in_string_ = false;
                pos = end;
            } else if (string_quote_.size() == 1 && !ends_with_backslash_newline(line)) {
                throw TokenizeError("unterminated string literal", string_start_row_);
            } else {
                string_text_ += line;
                string_lines_ += line;
                return;
            }
        } else if (brackets_.empty() && !continued_) {
            if (!start_logical_line(line, pos)) {
                return;
            }
        } else {
            continued_ = false;
        }

        scan_tokens(line, pos);
    }

    // Handles indentation at the start of a logical line. Returns false when
    // the line carries no code (blank or comment-only).
    auto start_logical_line(const std::string& line, size_t& pos) -> bool {
        size_t column = 0;
        while (pos < line.size()) {
            char c = line[pos];
            if (c == ' ') {
                ++column;
            } else if (c == '\t') {
                column = (column / 8 + 1) * 8;
            } else if (c == '\f') {
                column = 0;
            } else {
                break;
            }
            ++pos;
        }

        if (pos == line.size()) {
            return false;
        }

        if (line[pos] == '#' || is_line_break(line, pos)) {
            if (line[pos] == '#') {
                auto comment_end = line.find_first_of("\r\n", pos);
                if (comment_end == std::string::npos) {
                    comment_end = line.size();
                }
                emit(TokenType::COMMENT, line.substr(pos, comment_end - pos), row_, line);
                pos = comment_end;
            }
            emit(TokenType::NL, line.substr(pos), row_, line);
            return false;
        }

        if (column > indents_.back()) {
            indents_.push_back(column);
            emit(TokenType::INDENT, line.substr(0, pos), row_, line);
        }
        if (std::find(indents_.begin(), indents_.end(), column) == indents_.end()) {
            throw TokenizeError("unindent does not match any outer indentation level", row_);
        }
        while (column < indents_.back()) {
            indents_.pop_back();
            emit(TokenType::DEDENT, "", row_, line);
        }
        return true;
    }

    auto scan_tokens(const std::string& line, size_t pos) -> void {
        while (pos < line.size()) {
            char c = line[pos];

            if (c == ' ' || c == '\t' || c == '\f') {
                ++pos;
            } else if (c == '#') {
                auto comment_end = line.find_first_of("\r\n", pos);
                if (comment_end == std::string::npos) {
                    comment_end = line.size();
                }
                emit(TokenType::COMMENT, line.substr(pos, comment_end - pos), row_, line);
                pos = comment_end;
            } else if (is_line_break(line, pos)) {
                emit(brackets_.empty() ? TokenType::NEWLINE : TokenType::NL, line.substr(pos),
                     row_, line);
                return;
            } else if (c == '\\') {
                if (pos + 1 != line.size() && !is_line_break(line, pos + 1)) {
                    throw TokenizeError("unexpected character after line continuation character",
                                        row_);
                }
                continued_ = true;
                return;
            } else if (std::isdigit(static_cast<unsigned char>(c))
                       || (c == '.' && pos + 1 < line.size()
                           && std::isdigit(static_cast<unsigned char>(line[pos + 1])))) {
                pos = scan_number(line, pos);
            } else if (auto prefix_length = string_prefix_length(line, pos);
                       prefix_length.has_value()) {
                if (!scan_string(line, pos, *prefix_length)) {
                    return;
                }
            } else if (is_identifier_start(c)) {
                auto end = pos;
                while (end < line.size() && is_identifier_char(line[end])) {
                    ++end;
                }
                emit(TokenType::NAME, line.substr(pos, end - pos), row_, line);
                pos = end;
            } else {
                pos = scan_operator(line, pos);
            }
        }
    }

    auto scan_number(const std::string& line, size_t pos) -> size_t {
        auto end = pos;
        auto digits = [&](auto predicate) {
            while (end < line.size() && (predicate(line[end]) || line[end] == '_')) {
                ++end;
            }
        };
        auto is_decimal = [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; };

        if (line[end] == '0' && end + 1 < line.size()
            && std::string_view("xXoObB").find(line[end + 1]) != std::string_view::npos) {
            end += 2;
            digits([](char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; });
        } else {
            digits(is_decimal);
            if (end < line.size() && line[end] == '.') {
                ++end;
                digits(is_decimal);
            }
            if (end < line.size() && (line[end] == 'e' || line[end] == 'E')) {
                auto exponent = end + 1;
                if (exponent < line.size() && (line[exponent] == '+' || line[exponent] == '-')) {
                    ++exponent;
                }
                if (exponent < line.size() && is_decimal(line[exponent])) {
                    end = exponent;
                    digits(is_decimal);
                }
            }
            if (end < line.size() && (line[end] == 'j' || line[end] == 'J')) {
                ++end;
            }
        }

        emit(TokenType::NUMBER, line.substr(pos, end - pos), row_, line);
        return end;
    }

    auto string_prefix_length(const std::string& line, size_t pos) -> std::optional<size_t> {
        if (is_quote(line[pos])) {
            return 0;
        }
        for (size_t length : {size_t{2}, size_t{1}}) {
            if (pos + length < line.size() && is_quote(line[pos + length])
                && is_string_prefix(std::string_view(line).substr(pos, length))) {
                return length;
            }
        }
        return std::nullopt;
    }

    // Returns false when the literal continues on the next physical line
    auto scan_string(const std::string& line, size_t& pos, size_t prefix_length) -> bool {
        auto quote_pos = pos + prefix_length;
        char quote = line[quote_pos];
        bool triple = line.compare(quote_pos, 3, std::string(3, quote)) == 0;
        std::string delimiter(triple ? 3 : 1, quote);

        auto end = find_string_end(line, quote_pos + delimiter.size(), delimiter);
        if (end != std::string::npos) {
            emit(TokenType::STRING, line.substr(pos, end - pos), row_, line);
            pos = end;
            return true;
        }

        if (!triple && !ends_with_backslash_newline(line)) {
            throw TokenizeError("unterminated string literal", row_);
        }

        in_string_ = true;
        string_quote_ = delimiter;
        string_start_row_ = row_;
        string_text_ = line.substr(pos);
        string_lines_ = line;
        return false;
    }

    // Index just past the closing delimiter, or npos if the line ends first
    static auto find_string_end(const std::string& line, size_t start, const std::string& delimiter)
        -> size_t {
        for (size_t i = start; i < line.size(); ++i) {
            if (line[i] == '\\') {
                ++i;
                continue;
            }
            if (delimiter.size() == 1 && line[i] == '\n') {
                return std::string::npos;
            }
            if (line.compare(i, delimiter.size(), delimiter) == 0) {
                return i + delimiter.size();
            }
        }
        return std::string::npos;
    }

    auto scan_operator(const std::string& line, size_t pos) -> size_t {
        auto rest = std::string_view(line).substr(pos);
        for (auto op : multi_char_operators) {
            if (rest.starts_with(op)) {
                emit(TokenType::OP, std::string(op), row_, line);
                return pos + op.size();
            }
        }

        char c = line[pos];
        if (single_char_operators.find(c) == std::string_view::npos) {
            throw TokenizeError(std::string("invalid character '") + c + "'", row_);
        }

        if (c == '(' || c == '[' || c == '{') {
            brackets_.push_back(c);
        } else if (c == ')' || c == ']' || c == '}') {
            if (brackets_.empty() || closing_bracket_for(brackets_.back()) != c) {
                throw TokenizeError(std::string("unmatched '") + c + "'", row_);
            }
            brackets_.pop_back();
        }

        emit(TokenType::OP, std::string(1, c), row_, line);
        return pos + 1;
    }

    auto finish() -> void {
        if (in_string_) {
            throw TokenizeError("EOF in multi-line string", string_start_row_);
        }
        if (!brackets_.empty() || continued_) {
            throw TokenizeError("EOF in multi-line statement", row_);
        }

        if (!tokens_.empty()) {
            auto last = tokens_.back().type;
            if (last != TokenType::NEWLINE && last != TokenType::NL) {
                emit(TokenType::NEWLINE, "", row_, "");
            }
        }
        while (indents_.size() > 1) {
            indents_.pop_back();
            emit(TokenType::DEDENT, "", row_, "");
        }
        emit(TokenType::ENDMARKER, "", row_, "");
    }
};

} // namespace

auto tokenize(std::string_view source) -> std::vector<Token> {
    return Tokenizer(source).run();
}

auto is_atom(TokenType type) -> bool {
    return type == TokenType::NAME || type == TokenType::NUMBER || type == TokenType::STRING;
}

auto token_type_name(TokenType type) -> std::string {
    switch (type) {
    case TokenType::NAME:
        return "NAME";
    case TokenType::NUMBER:
        return "NUMBER";
    case TokenType::STRING:
        return "STRING";
    case TokenType::OP:
        return "OP";
    case TokenType::COMMENT:
        return "COMMENT";
    case TokenType::NEWLINE:
        return "NEWLINE";
    case TokenType::NL:
        return "NL";
    case TokenType::INDENT:
        return "INDENT";
    case TokenType::DEDENT:
        return "DEDENT";
    case TokenType::ENDMARKER:
        return "ENDMARKER";
    }
    return "UNKNOWN";
}

} // namespace unflake
