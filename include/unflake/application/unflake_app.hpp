#pragma once

#include "unflake/core/fixed_point_driver.hpp"
#include "unflake/core/safe_symbols.hpp"
#include "unflake/interfaces.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace unflake {

inline constexpr const char* UNFLAKE_VERSION = "1.0.0";

struct Config {
    std::vector<std::string> files;
    bool in_place = false;
    bool recursive = false;
    std::vector<std::string> additional_imports;  // --imports
    bool remove_all_unused_imports = false;
    bool remove_unused_variables = false;
    std::string stdlib_dir;                        // Extra stdlib names to scan, if set
    std::string pyflakes_command = "pyflakes";
    size_t max_iterations = FixedPointDriver::DEFAULT_MAX_ITERATIONS;
    bool verbose = false;
};

class UnflakeApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IDiagnosticSource> diagnostics_;
    std::ostream& out_;
    std::ostream& err_;

public:
    UnflakeApp(std::unique_ptr<IFileSystem> filesystem,
               std::unique_ptr<IDiagnosticSource> diagnostics, std::ostream& out = std::cout,
               std::ostream& err = std::cerr);

    // Exit status: 0 on success, 1 if any file could not be read or written
    // or the options conflict
    auto run(const Config& config) -> int;

private:
    auto build_registry(const Config& config) -> SafeSymbolRegistry;
    auto collect_files(const Config& config) -> std::vector<std::string>;
    auto fix_file(const std::string& path, const RewritePolicy& policy, const Config& config)
        -> bool;
};

} // namespace unflake
