#include "unflake/core/source_text.hpp"

namespace unflake {

auto split_source(std::string_view source) -> SourceText {
    SourceText text;
    size_t start = 0;

    while (start < source.size()) {
        auto end = source.find('\n', start);
        if (end == std::string_view::npos) {
            text.lines.emplace_back(source.substr(start));
            break;
        }
        text.lines.emplace_back(source.substr(start, end - start + 1));
        start = end + 1;
    }

    return text;
}

auto render_source(const SourceText& text) -> std::string {
    size_t total = 0;
    for (const auto& line : text.lines) {
        total += line.size();
    }

    std::string output;
    output.reserve(total);
    for (const auto& line : text.lines) {
        output += line;
    }
    return output;
}

} // namespace unflake
