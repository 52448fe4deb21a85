#include "unflake/core/text_utils.hpp"
#include <cctype>

namespace unflake {

auto strip(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(python_whitespace);
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(python_whitespace);
    return std::string(text.substr(start, end - start + 1));
}

auto lstrip(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(python_whitespace);
    if (start == std::string_view::npos) {
        return "";
    }
    return std::string(text.substr(start));
}

auto rstrip(std::string_view text) -> std::string {
    auto end = text.find_last_not_of(python_whitespace);
    if (end == std::string_view::npos) {
        return "";
    }
    return std::string(text.substr(0, end + 1));
}

auto split_by_whitespace(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    size_t pos = 0;

    while (pos < text.size()) {
        auto start = text.find_first_not_of(python_whitespace, pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = text.find_first_of(python_whitespace, start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        tokens.emplace_back(text.substr(start, end - start));
        pos = end;
    }

    return tokens;
}

auto split(std::string_view text, char delimiter) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t start = 0;

    while (true) {
        auto end = text.find(delimiter, start);
        if (end == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            return parts;
        }
        parts.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
}

auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

// Bytes >= 0x80 are accepted so that UTF-8 encoded identifiers pass through
auto is_identifier_start(char c) -> bool {
    auto byte = static_cast<unsigned char>(c);
    return std::isalpha(byte) || c == '_' || byte >= 0x80;
}

auto is_identifier_char(char c) -> bool {
    auto byte = static_cast<unsigned char>(c);
    return std::isalnum(byte) || c == '_' || byte >= 0x80;
}

auto is_identifier(std::string_view text) -> bool {
    if (text.empty() || !is_identifier_start(text.front())) {
        return false;
    }
    for (char c : text) {
        if (!is_identifier_char(c)) {
            return false;
        }
    }
    return true;
}

} // namespace unflake
