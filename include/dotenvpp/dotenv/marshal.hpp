#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "dotenvpp/core/env_map.hpp"

namespace dotenvpp::dotenv {

/// Backslash-escapes a value for use inside double quotes. `$` is left
/// alone so that references survive a round trip.
auto double_quote_escape(std::string_view value) -> std::string;

/// Renders the map as `KEY="VALUE"` lines in map order, newline-terminated.
auto marshal(const EnvMap& map) -> std::string;

/// Renders the map as a JSON object whose members keep map order.
auto to_json(const EnvMap& map) -> nlohmann::ordered_json;

} // namespace dotenvpp::dotenv
