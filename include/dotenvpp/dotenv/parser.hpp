#pragma once

#include <istream>
#include <string>
#include <string_view>

#include "dotenvpp/core/env_map.hpp"
#include "dotenvpp/core/environment.hpp"
#include "dotenvpp/core/error.hpp"

namespace dotenvpp::dotenv {

/// A decoded assignment, before it is stored.
struct Assignment {
    std::string key;
    std::string value;
};

/// True for lines that are blank or whose first non-whitespace character
/// is `#`.
auto is_ignored_line(std::string_view line) -> bool;

/// Drops trailing `#` comments while keeping `#` characters that appear
/// inside quotes.
///
/// The line is cut into segments at every `#`. A segment holding exactly
/// one unescaped `"` or exactly one unescaped `'` opens or closes a quoted
/// span. The first segment, the segments of an open span and the segment
/// that closes it are kept and rejoined with `#`. Segments with zero or
/// several quotes never change the state, so lines with stray quotes can be
/// cut in the wrong place.
auto strip_comment(std::string_view line) -> std::string;

/// Separates the key from the raw (undecoded) value.
///
/// Splits on the first `:` when it comes before any `=` (YAML style),
/// otherwise on the first `=`. A leading `export` is removed from the key
/// and surrounding whitespace is trimmed.
auto split_line(std::string_view line) -> Result<Assignment>;

/// Removes backslash escapes from the body of a double-quoted value:
/// `\n` and `\r` become control characters, any other `\X` except `\$`
/// becomes `X`.
auto unescape_double_quoted(std::string_view value) -> std::string;

/// Substitutes `$NAME`, `${NAME}` references. Names resolve against `map`
/// first, then `env`, then the empty string. `\$NAME` and `$(` are kept
/// literally with their leading marker dropped.
auto expand_variables(std::string_view value, const EnvMap& map, const Environment& env)
    -> std::string;

/// Decodes a raw value: trims spaces, removes one layer of matching quotes,
/// unescapes double-quoted text and expands unless single-quoted.
auto parse_value(std::string_view raw, const EnvMap& map, bool expand, const Environment& env)
    -> std::string;

/// Decodes one non-ignored line into an assignment. `map` holds the entries
/// decoded so far and is consulted by expansion.
auto parse_line(std::string_view line, const EnvMap& map, bool expand, const Environment& env)
    -> Result<Assignment>;

/// Parses a whole dotenv document. Reading stops at the first failing line.
auto parse(std::istream& in, bool expand = true,
           const Environment& env = process_environment()) -> Result<EnvMap>;

auto parse(std::string_view text, bool expand = true,
           const Environment& env = process_environment()) -> Result<EnvMap>;

/// Parses text with expansion against the process environment.
auto unmarshal(std::string_view text) -> Result<EnvMap>;

} // namespace dotenvpp::dotenv
