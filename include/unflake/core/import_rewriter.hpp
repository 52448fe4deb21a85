#pragma once

#include "unflake/core/rewrite_policy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace unflake {

// Rewrites one physical line flagged with unused imports. The result keeps
// the line's indentation and terminator; splitting a multi-module import is
// the only case where more than one line comes back.
auto rewrite_import(const std::string& line, const std::vector<std::string>& unused_names,
                    const RewritePolicy& policy, const std::string& previous_line = "")
    -> std::string;

// "import b, a\n" -> "import a\nimport b\n". Lines without a terminator are
// returned unchanged.
auto break_up_import(const std::string& line) -> std::string;

// Drops the names listed in unused_names (dotted "a.b" or bare "b") from a
// "from a import ..." line; "pass" when nothing is left.
auto filter_from_import(const std::string& line, const std::vector<std::string>& unused_names)
    -> std::string;

// Top-level package of an import line ("os" for "import os.path")
auto extract_package_name(const std::string& line) -> std::optional<std::string>;

} // namespace unflake
