#include "dotenvpp/cli/app.hpp"
#include "dotenvpp/core/logger.hpp"

#include <filesystem>

// Version string; typically injected by CMake via -DDOTENVPP_VERSION_STRING=...
#ifndef DOTENVPP_VERSION_STRING
#define DOTENVPP_VERSION_STRING "0.1.0-dev"
#endif

namespace dotenvpp::cli {

App::App(std::ostream& out, std::ostream& err)
    : cli_("dotenvpp", "Read, write and run commands with dotenv files")
    , io_{out, err}
{
    cli_.set_version_flag("--version", DOTENVPP_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("DOTENVPP_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("-f,--file", files_,
                    "Dotenv file to read; repeat to merge several (default: .env)")
        ->allow_extra_args(false);

    cli_.add_flag("--no-expand", no_expand_,
                  "Do not substitute $VAR references");

    // Global option: log level override.
    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname("DOTENVPP_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, const char* const* argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e, io_.out, io_.err);
    }

    resolve_config();

    for (const auto& command : commands_) {
        if (command.subcommand->parsed()) {
            return command.run();
        }
    }

    // Unreachable with require_subcommand(1).
    io_.err << cli_.help();
    return 1;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::config() const -> const Config& {
    return config_;
}

void App::setup_commands() {
    commands_.push_back(register_print_command(cli_, config_, io_));
    commands_.push_back(register_get_command(cli_, config_, io_));
    commands_.push_back(register_exec_command(cli_, config_, io_));
    commands_.push_back(register_write_command(cli_, config_, io_));
    commands_.push_back(register_version_command(cli_, io_));
}

void App::resolve_config() {
    Logger::init("dotenvpp", log_level_.empty() ? config_.log_level : log_level_);

    if (!config_path_.empty()) {
        LOG_INFO("Loading configuration from: {}", config_path_);
        config_ = load_config(std::filesystem::path(config_path_));
    }

    if (!files_.empty()) {
        config_.files = files_;
    }
    if (no_expand_) {
        config_.expand = false;
    }
    if (!log_level_.empty()) {
        config_.log_level = log_level_;
    }

    Logger::set_level(config_.log_level);
}

} // namespace dotenvpp::cli
