#pragma once

#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "dotenvpp/cli/commands.hpp"
#include "dotenvpp/core/config.hpp"

namespace dotenvpp::cli {

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11, resolves the configuration
/// (JSON config file first, then command-line overrides) and runs the
/// selected subcommand.
class App {
public:
    explicit App(std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, const char* const* argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    /// The configuration in effect after run() resolved it.
    [[nodiscard]] auto config() const -> const Config&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    /// Loads the config file and applies command-line overrides.
    void resolve_config();

    CLI::App cli_;
    Output io_;
    Config config_;
    std::string config_path_;
    std::vector<std::string> files_;
    std::string log_level_;
    bool no_expand_ = false;
    std::vector<Command> commands_;
};

} // namespace dotenvpp::cli
