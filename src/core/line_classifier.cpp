#include "unflake/core/line_classifier.hpp"
#include "unflake/core/python_tokenizer.hpp"
#include "unflake/core/text_utils.hpp"
#include <algorithm>
#include <regex>

namespace unflake {

namespace {

const std::regex plain_import_pattern{R"(^\s*import\s)"};
const std::regex from_import_pattern{R"(^\s*from\s)"};
const std::regex except_binding_pattern{R"(^\s*except [\s,().\w]+ as \w+:$)"};

auto tokenizes_standalone(const std::string& line) -> bool {
    try {
        tokenize(line);
        return true;
    } catch (const TokenizeError&) {
        return false;
    }
}

} // namespace

auto classify(const std::string& line, const std::string& previous_line) -> LineRole {
    if (line.find('#') != std::string::npos) {
        return LineRole::COMMENT;
    }
    if (is_except_binding(line)) {
        return LineRole::EXCEPT_BINDING;
    }
    if (is_from_import(line) || is_plain_import(line)) {
        if (is_multiline_import(line, previous_line)) {
            return LineRole::CONTINUATION;
        }
        return is_from_import(line) ? LineRole::FROM_IMPORT : LineRole::PLAIN_IMPORT;
    }
    if (is_multiline_statement(line, previous_line)) {
        return LineRole::CONTINUATION;
    }
    if (std::count(line.begin(), line.end(), '=') == 1) {
        return LineRole::ASSIGNMENT;
    }
    return LineRole::OTHER;
}

auto is_multiline_statement(const std::string& line, const std::string& previous_line) -> bool {
    if (line.find_first_of("\\:;") != std::string::npos) {
        return true;
    }
    if (!tokenizes_standalone(line)) {
        return true;
    }
    return rstrip(previous_line).ends_with('\\');
}

auto is_multiline_import(const std::string& line, const std::string& previous_line) -> bool {
    if (line.find_first_of("()") != std::string::npos) {
        return true;
    }

    // Doctest prompt
    if (lstrip(line).starts_with('>')) {
        return true;
    }

    return is_multiline_statement(line, previous_line);
}

auto is_plain_import(const std::string& line) -> bool {
    return std::regex_search(line, plain_import_pattern);
}

auto is_from_import(const std::string& line) -> bool {
    return std::regex_search(line, from_import_pattern);
}

auto is_except_binding(const std::string& line) -> bool {
    return std::regex_match(line_body(line), except_binding_pattern);
}

auto indentation(const std::string& line) -> std::string {
    if (strip(line).empty()) {
        return "";
    }
    return line.substr(0, line.find_first_not_of(python_whitespace));
}

auto line_ending(const std::string& line) -> std::string {
    auto end = line.find_last_not_of(python_whitespace);
    if (end == std::string::npos) {
        return line;
    }
    return line.substr(end + 1);
}

auto line_body(const std::string& line) -> std::string {
    if (line.ends_with("\r\n")) {
        return line.substr(0, line.size() - 2);
    }
    if (line.ends_with('\n')) {
        return line.substr(0, line.size() - 1);
    }
    return line;
}

} // namespace unflake
