#pragma once

#include "unflake/core/diagnostic.hpp"
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace unflake {

class PyflakesParser {
public:
    auto parse_report(const std::string& pyflakes_output) -> std::vector<Diagnostic>;

private:
    auto parse_single_message(const std::string& line) -> std::optional<Diagnostic>;

    // file:line: message, or file:line:column: message for newer releases
    static inline const std::regex location_pattern_{R"(^(.+?):(\d+):(?:\d+:)?\s+(.+?)\s*$)"};
    static inline const std::regex unused_import_pattern_{R"(^'(.+?)' imported but unused$)"};
    static inline const std::regex unused_variable_pattern_{
        R"(^local variable '(.+?)' is assigned to but never used$)"};
};

} // namespace unflake
