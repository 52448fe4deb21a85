#pragma once

#include <set>
#include <string>
#include <string_view>

namespace unflake {

// Line numbers (1-based) of "pass" statements that no block needs:
// - trailing: the pass follows another statement of its block (or of the
//   module)
// - leading: the next line starts a statement at the same indentation
// - a pass opening the module when a later module-level statement exists
// Throws TokenizeError when the source does not tokenize.
auto useless_pass_line_numbers(std::string_view source) -> std::set<size_t>;

// Removes useless "pass" lines; returns the source unchanged if it does
// not tokenize.
auto compact(const std::string& source) -> std::string;

} // namespace unflake
