#pragma once

#include "unflake/core/diagnostic.hpp"
#include "unflake/interfaces.hpp"
#include "unflake/parsers/pyflakes_parser.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace unflake {

class AnalyzerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Diagnostic source backed by the pyflakes command line tool. Each call
// writes the text to a temporary file and runs the command on it.
class PyflakesRunner : public IDiagnosticSource {
public:
    explicit PyflakesRunner(std::vector<std::string> command = {"pyflakes"});

    // Throws AnalyzerError if the command cannot be run
    auto analyze(const std::string& source) -> std::vector<Diagnostic> override;

    // "python3 -m pyflakes" -> {"python3", "-m", "pyflakes"}
    static auto split_command(const std::string& command_line) -> std::vector<std::string>;

private:
    std::vector<std::string> command_;
    PyflakesParser parser_;

    auto run_command(const std::string& path) -> std::string;
};

} // namespace unflake
