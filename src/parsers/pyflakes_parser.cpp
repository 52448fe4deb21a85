#include "unflake/parsers/pyflakes_parser.hpp"
#include <sstream>

namespace unflake {

auto PyflakesParser::parse_report(const std::string& pyflakes_output) -> std::vector<Diagnostic> {
    std::vector<Diagnostic> diagnostics;
    std::istringstream iss(pyflakes_output);
    std::string line;

    while (std::getline(iss, line)) {
        if (auto diagnostic = parse_single_message(line)) {
            diagnostics.push_back(*diagnostic);
        }
    }

    return diagnostics;
}

auto PyflakesParser::parse_single_message(const std::string& line) -> std::optional<Diagnostic> {
    std::smatch location;
    if (!std::regex_match(line, location, location_pattern_)) {
        return std::nullopt;
    }

    size_t line_number = 0;
    try {
        line_number = static_cast<size_t>(std::stoul(location[2].str()));
    } catch (const std::exception&) {
        // Out of range, skip this message
        return std::nullopt;
    }

    auto message = location[3].str();
    std::smatch name;
    if (std::regex_match(message, name, unused_import_pattern_)) {
        return Diagnostic{.kind = DiagnosticKind::UNUSED_IMPORT,
                          .line_number = line_number,
                          .symbol = name[1].str()};
    }
    if (std::regex_match(message, name, unused_variable_pattern_)) {
        return Diagnostic{.kind = DiagnosticKind::UNUSED_VARIABLE,
                          .line_number = line_number,
                          .symbol = name[1].str()};
    }

    return std::nullopt;
}

} // namespace unflake
