#pragma once

#include <string>

namespace unflake {

enum class LineRole {
    COMMENT,         // Carries a '#' anywhere on the line
    CONTINUATION,    // Part of a statement spanning more than this line
    PLAIN_IMPORT,    // import a, b.c
    FROM_IMPORT,     // from a import b, c
    ASSIGNMENT,      // Exactly one '='
    EXCEPT_BINDING,  // except E as name:
    OTHER
};

// Pure functions of a physical line (terminator included) and its predecessor
auto classify(const std::string& line, const std::string& previous_line = "") -> LineRole;

auto is_multiline_statement(const std::string& line, const std::string& previous_line = "")
    -> bool;
auto is_multiline_import(const std::string& line, const std::string& previous_line = "") -> bool;

auto is_plain_import(const std::string& line) -> bool;
auto is_from_import(const std::string& line) -> bool;
auto is_except_binding(const std::string& line) -> bool;

// Leading whitespace, empty for a blank line
auto indentation(const std::string& line) -> std::string;

// Trailing whitespace including the terminator, empty for a final
// unterminated line without trailing blanks
auto line_ending(const std::string& line) -> std::string;

// The line without its "\n" or "\r\n" terminator
auto line_body(const std::string& line) -> std::string;

} // namespace unflake
