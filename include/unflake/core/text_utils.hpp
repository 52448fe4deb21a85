#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace unflake {

// Whitespace as Python's str.strip() sees it for ASCII text
inline constexpr std::string_view python_whitespace = " \t\n\r\v\f\x1c\x1d\x1e\x1f";

auto strip(std::string_view text) -> std::string;
auto lstrip(std::string_view text) -> std::string;
auto rstrip(std::string_view text) -> std::string;

auto split_by_whitespace(std::string_view text) -> std::vector<std::string>;
auto split(std::string_view text, char delimiter) -> std::vector<std::string>;
auto join(const std::vector<std::string>& parts, std::string_view separator) -> std::string;

auto is_identifier_start(char c) -> bool;
auto is_identifier_char(char c) -> bool;
auto is_identifier(std::string_view text) -> bool;

} // namespace unflake
