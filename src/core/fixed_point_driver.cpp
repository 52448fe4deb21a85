#include "unflake/core/fixed_point_driver.hpp"
#include "unflake/core/import_rewriter.hpp"
#include "unflake/core/pass_compactor.hpp"
#include "unflake/core/source_text.hpp"
#include "unflake/core/variable_rewriter.hpp"
#include <exception>
#include <unordered_map>
#include <unordered_set>

namespace unflake {

FixedPointDriver::FixedPointDriver(IDiagnosticSource& diagnostics, const RewritePolicy& policy,
                                   size_t max_iterations)
    : diagnostics_(diagnostics), policy_(policy), max_iterations_(max_iterations) {}

auto FixedPointDriver::run(const std::string& source) -> FixResult {
    FixResult result;
    result.source = source;

    if (source.empty()) {
        result.converged = true;
        return result;
    }

    auto policy = policy_;
    // The analyzer reports names bound through "nonlocal" as unused
    if (source.find("nonlocal") != std::string::npos) {
        policy.remove_unused_variables = false;
    }

    while (result.iterations < max_iterations_) {
        ++result.iterations;

        auto diagnostics = analyze(result.source, result);
        auto filtered = compact(filter_code(result.source, diagnostics, policy));

        if (filtered == result.source) {
            result.converged = true;
            return result;
        }
        result.source = std::move(filtered);
    }

    return result;
}

auto FixedPointDriver::analyze(const std::string& source, FixResult& result)
    -> std::vector<Diagnostic> {
    try {
        return diagnostics_.analyze(source);
    } catch (const std::exception& e) {
        result.analyzer_errors.emplace_back(e.what());
        return {};
    }
}

auto filter_code(const std::string& source, const std::vector<Diagnostic>& diagnostics,
                 const RewritePolicy& policy) -> std::string {
    std::unordered_set<size_t> import_lines;
    std::unordered_map<size_t, std::vector<std::string>> unused_names;
    std::unordered_set<size_t> variable_lines;

    for (const auto& diagnostic : diagnostics) {
        switch (diagnostic.kind) {
        case DiagnosticKind::UNUSED_IMPORT:
            import_lines.insert(diagnostic.line_number);
            if (diagnostic.symbol) {
                unused_names[diagnostic.line_number].push_back(*diagnostic.symbol);
            }
            break;
        case DiagnosticKind::UNUSED_VARIABLE:
            if (policy.remove_unused_variables) {
                variable_lines.insert(diagnostic.line_number);
            }
            break;
        }
    }

    auto text = split_source(source);
    SourceText output;
    output.lines.reserve(text.lines.size());

    std::string previous_line;
    for (size_t i = 0; i < text.lines.size(); ++i) {
        const auto& line = text.lines[i];
        size_t line_number = i + 1;

        if (line.find('#') != std::string::npos) {
            // Inline comments make line-local rewriting ambiguous
            output.lines.push_back(line);
        } else if (import_lines.contains(line_number)) {
            output.lines.push_back(
                rewrite_import(line, unused_names[line_number], policy, previous_line));
        } else if (variable_lines.contains(line_number)) {
            output.lines.push_back(rewrite_variable(line, previous_line));
        } else {
            output.lines.push_back(line);
        }

        previous_line = line;
    }

    return render_source(output);
}

auto fix_code(const std::string& source, IDiagnosticSource& diagnostics,
              const RewritePolicy& policy) -> std::string {
    return FixedPointDriver(diagnostics, policy).run(source).source;
}

} // namespace unflake
