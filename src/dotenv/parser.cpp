#include "dotenvpp/dotenv/parser.hpp"
#include "dotenvpp/core/logger.hpp"
#include "dotenvpp/core/utils.hpp"

#include <sstream>
#include <vector>

namespace dotenvpp::dotenv {

namespace {

constexpr std::string_view kExportPrefix = "export";

auto count_unescaped(std::string_view segment, char quote) -> std::size_t {
    std::size_t count = 0;
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == quote && (i == 0 || segment[i - 1] != '\\')) {
            ++count;
        }
    }
    return count;
}

auto is_wrapped_in(std::string_view value, char quote) -> bool {
    return value.size() > 1 && value.front() == quote && value.back() == quote;
}

auto is_identifier_char(char c) -> bool {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

auto lookup(const std::string& name, const EnvMap& map, const Environment& env) -> std::string {
    if (auto entry = map.get(name)) {
        return entry->value;
    }
    if (auto val = env.get(name)) {
        return *val;
    }
    LOG_TRACE("Unresolved variable reference ${}", name);
    return {};
}

} // anonymous namespace

auto is_ignored_line(std::string_view line) -> bool {
    auto trimmed = utils::trim(line);
    return trimmed.empty() || trimmed.front() == '#';
}

auto strip_comment(std::string_view line) -> std::string {
    if (line.find('#') == std::string_view::npos) {
        return std::string(line);
    }

    bool quote_open = false;
    std::vector<std::string> kept;
    for (auto& segment : utils::split(line, '#')) {
        if (count_unescaped(segment, '"') == 1 || count_unescaped(segment, '\'') == 1) {
            if (quote_open) {
                quote_open = false;
                kept.push_back(segment);
            } else {
                quote_open = true;
            }
        }

        if (kept.empty() || quote_open) {
            kept.push_back(std::move(segment));
        }
    }

    return utils::join(kept, "#");
}

auto split_line(std::string_view line) -> Result<Assignment> {
    auto first_equals = line.find('=');
    auto first_colon = line.find(':');

    char separator = '=';
    if (first_colon != std::string_view::npos &&
        (first_equals == std::string_view::npos || first_colon < first_equals)) {
        separator = ':';
    }

    auto at = line.find(separator);
    if (at == std::string_view::npos) {
        return std::unexpected(make_error(ErrorCode::MalformedLine,
                                          "cannot separate key from value"));
    }

    auto key = line.substr(0, at);
    if (key.starts_with(kExportPrefix)) {
        key.remove_prefix(kExportPrefix.size());
    }

    return Assignment{utils::trim(key), std::string(line.substr(at + 1))};
}

auto unescape_double_quoted(std::string_view value) -> std::string {
    // First pass: control-character escapes. Other pairs are copied whole so
    // that `\\n` stays an escaped backslash followed by `n`.
    std::string expanded;
    expanded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] != '\n') {
            char next = value[i + 1];
            if (next == 'n') {
                expanded += '\n';
            } else if (next == 'r') {
                expanded += '\r';
            } else {
                expanded += value[i];
                expanded += next;
            }
            ++i;
        } else {
            expanded += value[i];
        }
    }

    // Second pass: `\X` -> `X`, except `\$` which protects a reference.
    std::string result;
    result.reserve(expanded.size());
    for (std::size_t i = 0; i < expanded.size(); ++i) {
        if (expanded[i] == '\\' && i + 1 < expanded.size() && expanded[i + 1] != '$') {
            result += expanded[i + 1];
            ++i;
        } else {
            result += expanded[i];
        }
    }
    return result;
}

auto expand_variables(std::string_view value, const EnvMap& map, const Environment& env)
    -> std::string {
    // A reference is: optional `\`, `$`, optional `(`, optional `{`, an
    // identifier run and an optional `}`. Each part is taken greedily.
    std::string result;
    result.reserve(value.size());

    std::size_t i = 0;
    while (i < value.size()) {
        auto start = i;
        bool escaped = false;
        if (value[i] == '\\' && i + 1 < value.size() && value[i + 1] == '$') {
            escaped = true;
            ++i;
        } else if (value[i] != '$') {
            result += value[i++];
            continue;
        }
        ++i;

        bool paren = i < value.size() && value[i] == '(';
        if (paren) ++i;
        if (i < value.size() && value[i] == '{') ++i;

        auto name_start = i;
        while (i < value.size() && is_identifier_char(value[i])) ++i;
        auto name = value.substr(name_start, i - name_start);

        if (i < value.size() && value[i] == '}') ++i;

        auto text = value.substr(start, i - start);
        if (escaped || paren) {
            result += text.substr(1);
        } else if (!name.empty()) {
            result += lookup(std::string(name), map, env);
        } else {
            result += text;
        }
    }

    return result;
}

auto parse_value(std::string_view raw, const EnvMap& map, bool expand, const Environment& env)
    -> std::string {
    auto value = utils::trim_chars(raw, " ");
    if (value.size() <= 1) {
        return value;
    }

    bool single_quoted = is_wrapped_in(value, '\'');
    bool double_quoted = is_wrapped_in(value, '"');

    if (single_quoted || double_quoted) {
        value = value.substr(1, value.size() - 2);
    }

    if (double_quoted) {
        value = unescape_double_quoted(value);
    }

    if (!single_quoted && expand) {
        value = expand_variables(value, map, env);
    }

    return value;
}

auto parse_line(std::string_view line, const EnvMap& map, bool expand, const Environment& env)
    -> Result<Assignment> {
    if (line.empty()) {
        return std::unexpected(make_error(ErrorCode::EmptyLine, "empty line"));
    }

    auto stripped = strip_comment(line);
    auto split = split_line(stripped);
    if (!split) {
        return std::unexpected(split.error());
    }

    split->value = parse_value(split->value, map, expand, env);
    return split;
}

auto parse(std::istream& in, bool expand, const Environment& env) -> Result<EnvMap> {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }

    if (in.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError, "failed to read dotenv input"));
    }

    EnvMap map;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (is_ignored_line(lines[i])) {
            continue;
        }

        auto assignment = parse_line(lines[i], map, expand, env);
        if (!assignment) {
            const auto& err = assignment.error();
            return std::unexpected(make_error(err.code(), std::string(err.message()),
                                              "line " + std::to_string(i + 1)));
        }

        LOG_TRACE("Parsed {} on line {}", assignment->key, i + 1);
        map.set(std::move(assignment->key), std::move(assignment->value));
    }

    LOG_DEBUG("Parsed {} variables", map.len());
    return map;
}

auto parse(std::string_view text, bool expand, const Environment& env) -> Result<EnvMap> {
    std::istringstream in{std::string(text)};
    return parse(in, expand, env);
}

auto unmarshal(std::string_view text) -> Result<EnvMap> {
    return parse(text, true, process_environment());
}

} // namespace dotenvpp::dotenv
