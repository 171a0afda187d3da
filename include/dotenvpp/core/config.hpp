#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace dotenvpp {

using json = nlohmann::json;

/// Settings for the command-line tool, read from a JSON file.
struct Config {
    std::vector<std::string> files;  // empty = ".env"
    bool expand = true;
    bool overload = false;
    bool line_numbers = false;
    std::string log_level = "warn";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, files, expand, overload, line_numbers, log_level)

/// Loads a config file, falling back to defaults (with a warning) when the
/// file is missing or is not valid JSON.
auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;

/// The configured files as paths, in order.
auto config_files(const Config& config) -> std::vector<std::filesystem::path>;

} // namespace dotenvpp
