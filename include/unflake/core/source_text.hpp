#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace unflake {

// Physical lines of a source buffer. Every line keeps its terminator; only
// the last line may lack one. Joining the lines gives back the exact input.
struct SourceText {
    std::vector<std::string> lines;
};

// Lines are split on '\n' only, so "\r\n" stays attached to its line
auto split_source(std::string_view source) -> SourceText;

auto render_source(const SourceText& text) -> std::string;

} // namespace unflake
