#include "dotenvpp/infra/dotenv.hpp"
#include "dotenvpp/core/logger.hpp"
#include "dotenvpp/dotenv/marshal.hpp"
#include "dotenvpp/dotenv/parser.hpp"
#include "dotenvpp/infra/process.hpp"

#include <fstream>

namespace dotenvpp::infra {

namespace {

auto read_all(const std::vector<std::filesystem::path>& filenames, bool expand,
              const Environment& env) -> Result<EnvMap> {
    EnvMap merged;
    for (const auto& filename : filenames_or_default(filenames)) {
        auto file_map = read_file(filename, expand, env);
        if (!file_map) {
            return std::unexpected(file_map.error());
        }
        file_map->iterate([&merged](std::string_view key, std::string_view value) {
            merged.set(std::string(key), std::string(value));
        });
    }
    return merged;
}

auto load_files(const std::vector<std::filesystem::path>& filenames, Environment& env,
                MergeMode mode, bool expand) -> VoidResult {
    for (const auto& filename : filenames_or_default(filenames)) {
        auto file_map = read_file(filename, expand, env);
        if (!file_map) {
            return std::unexpected(file_map.error());
        }
        if (auto applied = apply(*file_map, env, mode); !applied) {
            return applied;
        }
        LOG_INFO("Loaded .env from {}", filename.string());
    }
    return {};
}

} // anonymous namespace

auto filenames_or_default(std::vector<std::filesystem::path> filenames)
    -> std::vector<std::filesystem::path> {
    if (filenames.empty()) {
        return {std::filesystem::path(kDefaultFilename)};
    }
    return filenames;
}

auto read_file(const std::filesystem::path& path, bool expand, const Environment& env)
    -> Result<EnvMap> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Could not open .env file", path.string()));
    }

    auto map = dotenv::parse(file, expand, env);
    if (!map) {
        const auto& err = map.error();
        auto detail = path.string();
        if (!err.detail().empty()) {
            detail += ": ";
            detail += err.detail();
        }
        return std::unexpected(make_error(err.code(), std::string(err.message()),
                                          std::move(detail)));
    }

    LOG_DEBUG("Parsed {} variables from {}", map->len(), path.string());
    return map;
}

auto read(const std::vector<std::filesystem::path>& filenames, const Environment& env)
    -> Result<EnvMap> {
    return read_all(filenames, true, env);
}

auto read_no_expand(const std::vector<std::filesystem::path>& filenames,
                    const Environment& env) -> Result<EnvMap> {
    return read_all(filenames, false, env);
}

auto apply(const EnvMap& map, Environment& env, MergeMode mode) -> VoidResult {
    for (const auto& [key, value] : map) {
        if (mode == MergeMode::Preserve && env.contains(key)) {
            LOG_TRACE("Skipping existing env var: {}", key);
            continue;
        }
        if (auto result = env.set(key, value); !result) {
            return result;
        }
    }
    return {};
}

auto load(const std::vector<std::filesystem::path>& filenames, Environment& env)
    -> VoidResult {
    return load_files(filenames, env, MergeMode::Preserve, true);
}

auto overload(const std::vector<std::filesystem::path>& filenames, Environment& env)
    -> VoidResult {
    return load_files(filenames, env, MergeMode::Overwrite, true);
}

auto write(const EnvMap& map, const std::filesystem::path& path) -> VoidResult {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Could not create .env file", path.string()));
    }

    file << dotenv::marshal(map);
    file.flush();
    if (!file) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          "Failed to write .env file", path.string()));
    }

    LOG_DEBUG("Wrote {} variables to {}", map.len(), path.string());
    return {};
}

auto exec(const std::vector<std::filesystem::path>& filenames,
          const std::string& command,
          const std::vector<std::string>& args,
          Environment& env,
          MergeMode mode,
          bool expand) -> Result<int> {
    if (auto loaded = load_files(filenames, env, mode, expand); !loaded) {
        return std::unexpected(loaded.error());
    }
    return run_process(command, args, env.snapshot());
}

} // namespace dotenvpp::infra
