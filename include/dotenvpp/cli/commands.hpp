#pragma once

#include <functional>
#include <ostream>

#include <CLI/CLI.hpp>

#include "dotenvpp/core/config.hpp"

namespace dotenvpp::cli {

/// A registered subcommand and the action to run once it is selected and
/// the configuration has been resolved.
struct Command {
    CLI::App* subcommand = nullptr;
    std::function<int()> run;
};

/// Streams the commands write their results and diagnostics to.
struct Output {
    std::ostream& out;
    std::ostream& err;
};

/// Register the `print` subcommand.
/// Reads and merges the dotenv files and prints them as dotenv, plain or JSON.
auto register_print_command(CLI::App& app, const Config& config, Output io) -> Command;

/// Register the `get` subcommand.
/// Prints the value of one variable; exit code 1 when it is not defined.
auto register_get_command(CLI::App& app, const Config& config, Output io) -> Command;

/// Register the `exec` subcommand.
/// Loads the files into the environment and runs a command in it.
auto register_exec_command(CLI::App& app, const Config& config, Output io) -> Command;

/// Register the `write` subcommand.
/// Writes the merged variables to a file in normalized dotenv form.
auto register_write_command(CLI::App& app, const Config& config, Output io) -> Command;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app, Output io) -> Command;

} // namespace dotenvpp::cli
