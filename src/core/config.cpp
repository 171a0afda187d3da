#include "dotenvpp/core/config.hpp"
#include "dotenvpp/core/logger.hpp"

#include <fstream>

namespace dotenvpp {

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", path.string(), e.what());
        return default_config();
    }
}

auto default_config() -> Config {
    return Config{};
}

auto config_files(const Config& config) -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;
    paths.reserve(config.files.size());
    for (const auto& f : config.files) {
        paths.emplace_back(f);
    }
    return paths;
}

} // namespace dotenvpp
