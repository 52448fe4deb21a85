#pragma once

#include <string>

namespace unflake {

// Rewrites one physical line flagged with an unused local binding:
//   except E as e:     -> except E:
//   x = 1              -> pass
//   x = compute()      -> compute()
// Anything that cannot be proven safe from the line alone comes back as is.
auto rewrite_variable(const std::string& line, const std::string& previous_line = "")
    -> std::string;

// True when evaluating value has no observable effect: a literal, a bare
// name, or one of dict(), list(), set()
auto is_literal_or_name(const std::string& value) -> bool;

// Literal syntax accepted by a safe literal evaluator: numbers, strings and
// bytes (not f-strings), True/False/None, Ellipsis, and tuples, lists, sets
// and dicts built from them
auto is_literal(const std::string& value) -> bool;

} // namespace unflake
