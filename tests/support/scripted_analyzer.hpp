#pragma once

#include "unflake/core/diagnostic.hpp"
#include "unflake/core/source_text.hpp"
#include "unflake/interfaces.hpp"
#include <regex>
#include <string>
#include <vector>

namespace unflake::testing_support {

// Stands in for pyflakes: every rule reports its symbol on each line that
// matches its pattern in the text being analyzed
class ScriptedAnalyzer : public IDiagnosticSource {
public:
    struct Rule {
        DiagnosticKind kind;
        std::string symbol;
        std::regex pattern;
    };

    auto unused_import(const std::string& symbol, const std::string& pattern) -> ScriptedAnalyzer& {
        rules_.push_back(Rule{DiagnosticKind::UNUSED_IMPORT, symbol, std::regex(pattern)});
        return *this;
    }

    auto unused_variable(const std::string& symbol, const std::string& pattern)
        -> ScriptedAnalyzer& {
        rules_.push_back(Rule{DiagnosticKind::UNUSED_VARIABLE, symbol, std::regex(pattern)});
        return *this;
    }

    auto analyze(const std::string& source) -> std::vector<Diagnostic> override {
        ++calls_;
        std::vector<Diagnostic> diagnostics;
        auto text = split_source(source);
        for (size_t i = 0; i < text.lines.size(); ++i) {
            for (const auto& rule : rules_) {
                if (std::regex_search(text.lines[i], rule.pattern)) {
                    diagnostics.push_back(Diagnostic{
                        .kind = rule.kind, .line_number = i + 1, .symbol = rule.symbol});
                }
            }
        }
        return diagnostics;
    }

    auto calls() const -> size_t { return calls_; }

private:
    std::vector<Rule> rules_;
    size_t calls_ = 0;
};

} // namespace unflake::testing_support
