#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dotenvpp::utils {

/// Strips leading and trailing ASCII whitespace.
auto trim(std::string_view s) -> std::string;

/// Strips leading and trailing runs of the characters in `chars`.
auto trim_chars(std::string_view s, std::string_view chars) -> std::string;

/// Splits on every occurrence of `delim`. Always returns count(delim) + 1
/// pieces, keeping empty leading, inner and trailing pieces.
auto split(std::string_view s, char delim) -> std::vector<std::string>;

auto join(const std::vector<std::string>& parts, std::string_view delim) -> std::string;
auto replace_all(std::string_view s, std::string_view from, std::string_view to) -> std::string;

} // namespace dotenvpp::utils
