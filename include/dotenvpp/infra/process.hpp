#pragma once

#include <string>
#include <vector>

#include "dotenvpp/core/error.hpp"

namespace dotenvpp::infra {

/// Exit status reported when the command could not be executed.
inline constexpr int kExecFailedStatus = 127;

/// Runs `command` (looked up on PATH) with `args` and the environment
/// `env` (`NAME=VALUE` strings). The child inherits stdin, stdout and
/// stderr. Blocks until the child exits.
///
/// Returns the child's exit code, or 128 + signal number when it was
/// terminated by a signal.
auto run_process(const std::string& command,
                 const std::vector<std::string>& args,
                 const std::vector<std::string>& env) -> Result<int>;

} // namespace dotenvpp::infra
