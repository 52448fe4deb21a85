#include "unflake/core/import_rewriter.hpp"
#include "unflake/core/contract.hpp"
#include "unflake/core/line_classifier.hpp"
#include "unflake/core/text_utils.hpp"
#include <algorithm>
#include <regex>

namespace unflake {

namespace {

const std::regex import_keyword{R"(\bimport\b)"};
const std::regex from_module{R"(\bfrom\s+(\S+))"};

auto placeholder_for(const std::string& line) -> std::string {
    return indentation(line) + "pass" + line_ending(line);
}

auto split_names(const std::string& names) -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& part : split(names, ',')) {
        auto name = strip(part);
        if (!name.empty()) {
            result.push_back(std::move(name));
        }
    }
    return result;
}

auto assert_single_line_import(const std::string& line) -> void {
    UNFLAKE_ASSERT(line.find('\\') == std::string::npos, "continuation marker in import line");
    UNFLAKE_ASSERT(line.find('(') == std::string::npos, "grouping symbol in import line");
    UNFLAKE_ASSERT(line.find(')') == std::string::npos, "grouping symbol in import line");
    UNFLAKE_ASSERT(line.find(';') == std::string::npos, "statement separator in import line");
}

} // namespace

auto rewrite_import(const std::string& line, const std::vector<std::string>& unused_names,
                    const RewritePolicy& policy, const std::string& previous_line)
    -> std::string {
    auto role = classify(line, previous_line);
    if (role != LineRole::PLAIN_IMPORT && role != LineRole::FROM_IMPORT) {
        return line;
    }

    bool has_comma = line.find(',') != std::string::npos;
    if (role == LineRole::PLAIN_IMPORT && has_comma) {
        return break_up_import(line);
    }

    auto package = extract_package_name(line);
    if (!policy.remove_all_unused_imports
        && (!package || !policy.eligible_imports.contains(*package))) {
        return line;
    }

    if (has_comma) {
        return filter_from_import(line, unused_names);
    }

    // A lone import may be the only statement of a block
    return placeholder_for(line);
}

auto break_up_import(const std::string& line) -> std::string {
    assert_single_line_import(line);
    UNFLAKE_ASSERT(line.find('#') == std::string::npos, "comment in import line");
    UNFLAKE_ASSERT(!is_from_import(line), "from-import cannot be broken up");

    auto newline = line_ending(line);
    if (newline.empty()) {
        return line;
    }

    std::smatch match;
    if (!std::regex_search(line, match, import_keyword)) {
        return line;
    }

    auto leading = match.prefix().str();
    auto names = split_names(match.suffix().str());
    std::sort(names.begin(), names.end());

    std::string result;
    for (const auto& name : names) {
        result += leading + "import " + name + newline;
    }
    return result;
}

auto filter_from_import(const std::string& line, const std::vector<std::string>& unused_names)
    -> std::string {
    std::smatch match;
    if (!std::regex_search(line, match, import_keyword)) {
        return line;
    }
    auto head = match.prefix().str();
    auto names = split_names(match.suffix().str());

    std::smatch module_match;
    UNFLAKE_ASSERT(std::regex_search(head, module_match, from_module),
                   "from-import without a module");
    auto base_module = module_match[1].str();

    // Compare the full dotted name so that exactly the analyzer's module goes
    auto is_unused = [&](const std::string& name) {
        return std::find(unused_names.begin(), unused_names.end(), base_module + "." + name)
                   != unused_names.end()
               || std::find(unused_names.begin(), unused_names.end(), name) != unused_names.end();
    };
    std::erase_if(names, is_unused);

    if (names.empty()) {
        return placeholder_for(line);
    }

    std::sort(names.begin(), names.end());
    return head + "import " + join(names, ", ") + line_ending(line);
}

auto extract_package_name(const std::string& line) -> std::optional<std::string> {
    assert_single_line_import(line);

    if (!is_plain_import(line) && !is_from_import(line)) {
        return std::nullopt;  // Doctest or other non-import text
    }

    auto words = split_by_whitespace(line);
    if (words.size() < 2) {
        return std::nullopt;
    }

    auto package = words[1].substr(0, words[1].find('.'));
    UNFLAKE_ASSERT(package.find(' ') == std::string::npos, "space in package name");
    return package;
}

} // namespace unflake
