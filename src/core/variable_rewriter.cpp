#include "unflake/core/variable_rewriter.hpp"
#include "unflake/core/line_classifier.hpp"
#include "unflake/core/python_tokenizer.hpp"
#include "unflake/core/text_utils.hpp"
#include <regex>
#include <unordered_set>
#include <vector>

namespace unflake {

namespace {

const std::regex except_binding_clause{R"( as \w+:$)"};

const std::unordered_set<std::string> python_keywords = {
    "False",   "None",   "True",     "and",      "as",     "assert", "async",  "await",
    "break",   "class",  "continue", "def",      "del",    "elif",   "else",   "except",
    "finally", "for",    "from",     "global",   "if",     "import", "in",     "is",
    "lambda",  "nonlocal", "not",    "or",       "pass",   "raise",  "return", "try",
    "while",   "with",   "yield"};

auto is_layout_token(const Token& token) -> bool {
    switch (token.type) {
    case TokenType::NEWLINE:
    case TokenType::NL:
    case TokenType::INDENT:
    case TokenType::DEDENT:
    case TokenType::ENDMARKER:
    case TokenType::COMMENT:
        return true;
    default:
        return false;
    }
}

auto is_formatted_string(const std::string& text) -> bool {
    auto quote = text.find_first_of("'\"");
    auto prefix = text.substr(0, quote);
    return prefix.find_first_of("fF") != std::string::npos;
}

auto is_imaginary(const std::string& number) -> bool {
    return number.ends_with('j') || number.ends_with('J');
}

// Recursive descent over the tokens of a single expression
class LiteralParser {
public:
    explicit LiteralParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    auto parse() -> bool {
        return !tokens_.empty() && parse_value() && pos_ == tokens_.size();
    }

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    auto peek() const -> const Token* {
        return pos_ < tokens_.size() ? &tokens_[pos_] : nullptr;
    }

    auto accept_op(const std::string& op) -> bool {
        const auto* token = peek();
        if (token && token->type == TokenType::OP && token->text == op) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto parse_value() -> bool {
        if (accept_op("(")) {
            return parse_sequence(")");
        }
        if (accept_op("[")) {
            return parse_sequence("]");
        }
        if (accept_op("{")) {
            return parse_braces();
        }
        if (accept_op("...")) {
            return true;
        }
        return parse_number() || parse_strings() || parse_constant();
    }

    auto parse_sequence(const std::string& close) -> bool {
        if (accept_op(close)) {
            return true;
        }
        while (true) {
            if (!parse_value()) {
                return false;
            }
            if (accept_op(close)) {
                return true;
            }
            if (!accept_op(",")) {
                return false;
            }
            if (accept_op(close)) {
                return true;
            }
        }
    }

    auto parse_braces() -> bool {
        if (accept_op("}")) {
            return true;
        }
        if (!parse_value()) {
            return false;
        }
        if (!accept_op(":")) {
            if (accept_op("}")) {
                return true;
            }
            return accept_op(",") && parse_sequence("}");
        }

        // Dictionary display
        if (!parse_value()) {
            return false;
        }
        while (true) {
            if (accept_op("}")) {
                return true;
            }
            if (!accept_op(",")) {
                return false;
            }
            if (accept_op("}")) {
                return true;
            }
            if (!parse_value() || !accept_op(":") || !parse_value()) {
                return false;
            }
        }
    }

    // Signed numbers and complex literals such as -1 or 1+2j
    auto parse_number() -> bool {
        auto start = pos_;
        while (accept_op("-") || accept_op("+")) {
        }

        const auto* token = peek();
        if (!token || token->type != TokenType::NUMBER) {
            pos_ = start;
            return false;
        }
        ++pos_;

        auto before_imaginary = pos_;
        if (accept_op("+") || accept_op("-")) {
            const auto* imaginary = peek();
            if (imaginary && imaginary->type == TokenType::NUMBER && is_imaginary(imaginary->text)) {
                ++pos_;
            } else {
                pos_ = before_imaginary;
            }
        }
        return true;
    }

    // Adjacent string literals concatenate
    auto parse_strings() -> bool {
        auto start = pos_;
        while (const auto* token = peek()) {
            if (token->type != TokenType::STRING || is_formatted_string(token->text)) {
                break;
            }
            ++pos_;
        }
        if (const auto* token = peek(); token && token->type == TokenType::STRING) {
            pos_ = start;  // An f-string in the run can call arbitrary code
            return false;
        }
        return pos_ > start;
    }

    auto parse_constant() -> bool {
        const auto* token = peek();
        if (token && token->type == TokenType::NAME
            && (token->text == "True" || token->text == "False" || token->text == "None")) {
            ++pos_;
            return true;
        }
        return false;
    }
};

} // namespace

auto rewrite_variable(const std::string& line, const std::string& previous_line) -> std::string {
    switch (classify(line, previous_line)) {
    case LineRole::EXCEPT_BINDING: {
        auto body = line_body(line);
        auto header = std::regex_replace(body, except_binding_clause, ":",
                                         std::regex_constants::format_first_only);
        return header + line.substr(body.size());
    }

    case LineRole::ASSIGNMENT: {
        auto equals = line.find('=');
        auto target = strip(std::string_view(line).substr(0, equals));

        // Destructuring, augmented assignment, attributes and subscripts
        if (!is_identifier(target)) {
            return line;
        }

        auto value = lstrip(std::string_view(line).substr(equals + 1));
        if (value.empty()) {
            return line;
        }
        if (is_literal_or_name(value)) {
            // "pass" rather than nothing, in case this is a block's only statement
            return indentation(line) + "pass" + line_ending(line);
        }
        return indentation(line) + value;
    }

    default:
        return line;
    }
}

auto is_literal_or_name(const std::string& value) -> bool {
    auto stripped = strip(value);
    if (stripped == "dict()" || stripped == "list()" || stripped == "set()") {
        return true;
    }
    if (is_literal(value)) {
        return true;
    }

    // A plain name; dotted access could run a property and a bare keyword
    // such as yield is an expression of its own
    return is_identifier(stripped) && !python_keywords.contains(stripped);
}

auto is_literal(const std::string& value) -> bool {
    std::vector<Token> tokens;
    try {
        tokens = tokenize(strip(value));
    } catch (const TokenizeError&) {
        return false;
    }

    std::erase_if(tokens, is_layout_token);
    return LiteralParser(std::move(tokens)).parse();
}

} // namespace unflake
