#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace unflake {

// Top-level module names whose unused imports may be removed without the
// --remove-all-unused-imports switch. Built once and only read afterwards.
class SafeSymbolRegistry {
public:
    // Drops modules with import-time side effects, adds modules that are
    // commonly compiled into the interpreter, then adds additional_names.
    explicit SafeSymbolRegistry(const std::vector<std::string>& standard_names,
                                const std::vector<std::string>& additional_names = {});

    static auto with_builtin_standard_library(const std::vector<std::string>& additional_names = {})
        -> SafeSymbolRegistry;

    auto contains(const std::string& name) const -> bool;
    auto size() const -> size_t;
    auto sorted_names() const -> std::vector<std::string>;

private:
    std::unordered_set<std::string> names_;
};

auto builtin_standard_modules() -> const std::vector<std::string>&;

// Module name contributed by one directory entry of a standard library
// installation, if any ("json" for "json", "zlib" for "zlib.so")
auto standard_package_name(const std::string& entry) -> std::optional<std::string>;

// Scans a standard library directory and its lib-dynload subdirectory.
// A missing directory yields no names.
auto scan_standard_library(const std::filesystem::path& stdlib_dir) -> std::vector<std::string>;

} // namespace unflake
