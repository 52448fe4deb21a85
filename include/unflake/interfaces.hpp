#pragma once

#include <optional>
#include <string>
#include <vector>

namespace unflake {

// Forward declarations
struct Diagnostic;

// Abstract interfaces for dependency injection
class IDiagnosticSource {
public:
    virtual ~IDiagnosticSource() = default;
    // Diagnostics for exactly this text. May throw; callers treat a failure
    // as "nothing to report".
    virtual auto analyze(const std::string& source) -> std::vector<Diagnostic> = 0;
};

class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_file(const std::string& path, const std::string& content) -> bool = 0;
    virtual auto is_directory(const std::string& path) -> bool = 0;
    virtual auto collect_python_files(const std::string& directory) -> std::vector<std::string> = 0;
};

} // namespace unflake
