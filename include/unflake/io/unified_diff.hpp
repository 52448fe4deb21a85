#pragma once

#include <string>
#include <vector>

namespace unflake {

// Unified diff between two versions of a file, headed "original/<filename>"
// and "fixed/<filename>". Lines keep their terminators; a line without one
// is followed by "\ No newline at end of file". Empty when nothing changed.
auto unified_diff(const std::vector<std::string>& old_lines,
                  const std::vector<std::string>& new_lines, const std::string& filename,
                  size_t context = 3) -> std::string;

} // namespace unflake
