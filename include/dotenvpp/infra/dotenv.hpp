#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "dotenvpp/core/env_map.hpp"
#include "dotenvpp/core/environment.hpp"
#include "dotenvpp/core/error.hpp"

namespace dotenvpp::infra {

/// File read when no file names are given.
inline constexpr std::string_view kDefaultFilename = ".env";

/// How loaded values interact with variables already in the environment.
enum class MergeMode {
    Preserve,   ///< only set variables that are not already present
    Overwrite,  ///< always set
};

/// Returns `filenames`, or `{".env"}` when it is empty.
auto filenames_or_default(std::vector<std::filesystem::path> filenames)
    -> std::vector<std::filesystem::path>;

/// Parses a single dotenv file.
auto read_file(const std::filesystem::path& path, bool expand,
               const Environment& env = process_environment()) -> Result<EnvMap>;

/// Parses the files in order and merges them; a key repeated in a later
/// file keeps the position of its first occurrence and takes the later
/// value. The first unreadable or malformed file aborts the read.
auto read(const std::vector<std::filesystem::path>& filenames,
          const Environment& env = process_environment()) -> Result<EnvMap>;

/// Like read(), without variable expansion.
auto read_no_expand(const std::vector<std::filesystem::path>& filenames,
                    const Environment& env = process_environment()) -> Result<EnvMap>;

/// Copies `map` into `env` according to `mode`.
auto apply(const EnvMap& map, Environment& env, MergeMode mode) -> VoidResult;

/// Loads each file into `env`, never replacing variables that are already
/// set. Files are processed one after the other; a failure stops the load
/// but leaves earlier files applied.
auto load(const std::vector<std::filesystem::path>& filenames,
          Environment& env = process_environment()) -> VoidResult;

/// Like load(), replacing variables that are already set.
auto overload(const std::vector<std::filesystem::path>& filenames,
              Environment& env = process_environment()) -> VoidResult;

/// Serializes `map` and writes it to `path`, replacing any existing file.
auto write(const EnvMap& map, const std::filesystem::path& path) -> VoidResult;

/// Loads the files into `env` (preserving existing variables unless `mode`
/// says otherwise), then runs `command` with `args` in that environment.
/// With `expand` false, `$NAME` references are passed through verbatim.
/// @returns The child's exit status.
auto exec(const std::vector<std::filesystem::path>& filenames,
          const std::string& command,
          const std::vector<std::string>& args,
          Environment& env = process_environment(),
          MergeMode mode = MergeMode::Preserve,
          bool expand = true) -> Result<int>;

} // namespace dotenvpp::infra
