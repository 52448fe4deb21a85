#pragma once

#include <optional>
#include <string>

namespace unflake {

enum class DiagnosticKind {
    UNUSED_IMPORT,   // 'os' imported but unused
    UNUSED_VARIABLE  // local variable 'x' is assigned to but never used
};

// A finding from the external analyzer. line_number is 1-based and only
// valid for the exact text the analyzer was run on.
struct Diagnostic {
    DiagnosticKind kind{};
    size_t line_number{};
    std::optional<std::string> symbol;  // Dotted form for from-imports ("a.b")

    auto operator==(const Diagnostic& other) const -> bool = default;
};

} // namespace unflake
