#include "unflake/analysis/pyflakes_runner.hpp"
#include "unflake/application/unflake_app.hpp"
#include "unflake/core/contract.hpp"
#include "unflake/core/text_utils.hpp"
#include "unflake/io/file_system.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

auto print_usage(std::ostream& out) -> void {
    out << "Usage: unflake [options] files...\n";
    out << "  -i, --in-place                  Make changes to files instead of printing diffs\n";
    out << "  -r, --recursive                 Drill down directories recursively\n";
    out << "      --imports <a,b,...>         Additional modules/packages safe to remove\n";
    out << "      --remove-all-unused-imports Remove all unused imports, not just stdlib ones\n";
    out << "      --remove-unused-variables   Remove unused variables\n";
    out << "      --stdlib-dir <dir>          Also scan this directory for stdlib names\n";
    out << "      --pyflakes <command>        Analyzer command (default: pyflakes)\n";
    out << "      --max-iterations <n>        Fixed-point safety cap (default 100)\n";
    out << "  -v, --verbose                   Report iterations and analyzer problems\n";
    out << "      --version                   Print version and exit\n";
    out << "  -h, --help                      Show this help\n";
    out << "\nExamples:\n";
    out << "  unflake module.py                          # Show the diff\n";
    out << "  unflake -i -r --remove-unused-variables src # Fix a tree in place\n";
}

auto usage_error(const std::string& message) -> std::nullopt_t {
    std::cerr << "unflake: " << message << "\n";
    print_usage(std::cerr);
    return std::nullopt;
}

auto parse_count(const std::string& text) -> std::optional<size_t> {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        auto value = std::stoul(text);
        if (value == 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

// Returns nullopt on a usage error; help and version exit directly
auto parse_args(int argc, char* argv[]) -> std::optional<unflake::Config> {
    unflake::Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto has_value = i + 1 < argc;

        if (arg == "-i" || arg == "--in-place") {
            config.in_place = true;
        } else if (arg == "-r" || arg == "--recursive") {
            config.recursive = true;
        } else if (arg == "--imports") {
            if (!has_value) {
                return usage_error("--imports needs a value");
            }
            for (const auto& name : unflake::split(argv[++i], ',')) {
                if (auto stripped = unflake::strip(name); !stripped.empty()) {
                    config.additional_imports.push_back(stripped);
                }
            }
        } else if (arg == "--remove-all-unused-imports" || arg == "--remove-all") {
            config.remove_all_unused_imports = true;
        } else if (arg == "--remove-unused-variables") {
            config.remove_unused_variables = true;
        } else if (arg == "--stdlib-dir") {
            if (!has_value) {
                return usage_error("--stdlib-dir needs a value");
            }
            config.stdlib_dir = argv[++i];
        } else if (arg == "--pyflakes") {
            if (!has_value) {
                return usage_error("--pyflakes needs a value");
            }
            config.pyflakes_command = argv[++i];
        } else if (arg == "--max-iterations") {
            if (!has_value) {
                return usage_error("--max-iterations needs a value");
            }
            auto count = parse_count(argv[++i]);
            if (!count) {
                return usage_error("--max-iterations needs a positive number");
            }
            config.max_iterations = *count;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--version") {
            std::cout << "unflake " << unflake::UNFLAKE_VERSION << "\n";
            std::exit(0);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(std::cout);
            std::exit(0);
        } else if (arg.size() > 1 && arg.starts_with('-')) {
            return usage_error("unknown option " + arg);
        } else {
            config.files.push_back(arg);
        }
    }

    if (config.files.empty()) {
        return usage_error("no files given");
    }
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = parse_args(argc, argv);
    if (!config) {
        return 2;
    }

    auto command = unflake::PyflakesRunner::split_command(config->pyflakes_command);
    if (command.empty()) {
        std::cerr << "Error: empty --pyflakes command\n";
        return 2;
    }

    try {
        unflake::UnflakeApp app(std::make_unique<unflake::FileSystem>(),
                                std::make_unique<unflake::PyflakesRunner>(std::move(command)));
        return app.run(*config);
    } catch (const unflake::InternalError& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return 2;
    }
}
