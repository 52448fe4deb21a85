#include "unflake/application/unflake_app.hpp"
#include "unflake/core/source_text.hpp"
#include "unflake/io/unified_diff.hpp"
#include <unordered_set>

namespace unflake {

UnflakeApp::UnflakeApp(std::unique_ptr<IFileSystem> filesystem,
                       std::unique_ptr<IDiagnosticSource> diagnostics, std::ostream& out,
                       std::ostream& err)
    : filesystem_(std::move(filesystem)), diagnostics_(std::move(diagnostics)), out_(out),
      err_(err) {}

auto UnflakeApp::run(const Config& config) -> int {
    if (config.remove_all_unused_imports && !config.additional_imports.empty()) {
        err_ << "Using both --remove-all and --imports is redundant\n";
        return 1;
    }

    auto registry = build_registry(config);
    RewritePolicy policy{.eligible_imports = registry,
                         .remove_all_unused_imports = config.remove_all_unused_imports,
                         .remove_unused_variables = config.remove_unused_variables};

    bool failed = false;
    for (const auto& path : collect_files(config)) {
        if (!fix_file(path, policy, config)) {
            failed = true;
        }
    }
    return failed ? 1 : 0;
}

auto UnflakeApp::build_registry(const Config& config) -> SafeSymbolRegistry {
    auto standard_names = builtin_standard_modules();
    if (!config.stdlib_dir.empty()) {
        auto scanned = scan_standard_library(config.stdlib_dir);
        if (scanned.empty()) {
            err_ << "Warning: no standard library modules found in " << config.stdlib_dir << "\n";
        }
        standard_names.insert(standard_names.end(), scanned.begin(), scanned.end());
    }

    SafeSymbolRegistry registry(standard_names, config.additional_imports);
    if (config.verbose) {
        err_ << "Safe imports: " << registry.size() << " modules\n";
    }
    return registry;
}

// Expands directories when recursing and drops repeated paths, keeping the
// first occurrence
auto UnflakeApp::collect_files(const Config& config) -> std::vector<std::string> {
    std::vector<std::string> files;
    std::unordered_set<std::string> seen;

    auto add = [&](const std::string& path) {
        if (seen.insert(path).second) {
            files.push_back(path);
        }
    };

    for (const auto& name : config.files) {
        if (config.recursive && filesystem_->is_directory(name)) {
            for (const auto& path : filesystem_->collect_python_files(name)) {
                add(path);
            }
        } else {
            add(name);
        }
    }
    return files;
}

auto UnflakeApp::fix_file(const std::string& path, const RewritePolicy& policy,
                          const Config& config) -> bool {
    auto original = filesystem_->read_file(path);
    if (!original) {
        err_ << "Error: could not read " << path << "\n";
        return false;
    }

    FixedPointDriver driver(*diagnostics_, policy, config.max_iterations);
    auto result = driver.run(*original);

    if (config.verbose) {
        for (const auto& error : result.analyzer_errors) {
            err_ << "Warning: " << path << ": " << error << "\n";
        }
        err_ << path << ": " << result.iterations << " iteration"
             << (result.iterations == 1 ? "" : "s") << "\n";
    }
    if (!result.converged) {
        err_ << "Warning: " << path << ": no fixed point after " << config.max_iterations
             << " iterations\n";
    }

    if (result.source == *original) {
        return true;
    }

    if (config.in_place) {
        if (!filesystem_->write_file(path, result.source)) {
            err_ << "Error: could not write " << path << "\n";
            return false;
        }
        if (config.verbose) {
            err_ << "Fixed " << path << "\n";
        }
        return true;
    }

    out_ << unified_diff(split_source(*original).lines, split_source(result.source).lines, path);
    return true;
}

} // namespace unflake
