#pragma once

#include "unflake/core/diagnostic.hpp"
#include "unflake/core/rewrite_policy.hpp"
#include "unflake/interfaces.hpp"
#include <string>
#include <vector>

namespace unflake {

struct FixResult {
    std::string source;
    size_t iterations{};
    bool converged{};                          // False only when the iteration cap was hit
    std::vector<std::string> analyzer_errors;  // One entry per failed analysis
};

// Repeats diagnose -> rewrite -> compact until the text stops changing
class FixedPointDriver {
public:
    static constexpr size_t DEFAULT_MAX_ITERATIONS = 100;

    FixedPointDriver(IDiagnosticSource& diagnostics, const RewritePolicy& policy,
                     size_t max_iterations = DEFAULT_MAX_ITERATIONS);

    auto run(const std::string& source) -> FixResult;

private:
    IDiagnosticSource& diagnostics_;
    RewritePolicy policy_;
    size_t max_iterations_;

    auto analyze(const std::string& source, FixResult& result) -> std::vector<Diagnostic>;
};

// A single rewrite pass over source with diagnostics computed for it; no
// compaction
auto filter_code(const std::string& source, const std::vector<Diagnostic>& diagnostics,
                 const RewritePolicy& policy) -> std::string;

// Convenience wrapper returning only the final text
auto fix_code(const std::string& source, IDiagnosticSource& diagnostics,
              const RewritePolicy& policy) -> std::string;

} // namespace unflake
