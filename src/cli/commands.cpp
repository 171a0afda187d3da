#include "dotenvpp/cli/commands.hpp"
#include "dotenvpp/core/logger.hpp"
#include "dotenvpp/dotenv/marshal.hpp"
#include "dotenvpp/infra/dotenv.hpp"

#include <memory>
#include <string>
#include <vector>

// Version string; typically injected by CMake via -D, fallback to a default.
#ifndef DOTENVPP_VERSION_STRING
#define DOTENVPP_VERSION_STRING "0.1.0-dev"
#endif

namespace dotenvpp::cli {

namespace {

auto report(const Output& io, const Error& err) -> int {
    LOG_ERROR("{} ({})", err.what(), error_code_to_string(err.code()));
    io.err << "dotenvpp: " << err.what() << '\n';
    return 1;
}

auto read_configured(const Config& config) -> Result<EnvMap> {
    auto files = config_files(config);
    return config.expand ? infra::read(files) : infra::read_no_expand(files);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// print command
// ---------------------------------------------------------------------------

auto register_print_command(CLI::App& app, const Config& config, Output io) -> Command {
    struct Options {
        bool line_numbers = false;
        std::string format = "env";
    };
    auto opts = std::make_shared<Options>();

    auto* sub = app.add_subcommand("print", "Print the merged variables");
    sub->add_flag("-n,--line-numbers", opts->line_numbers,
                  "Prefix each entry with its position (plain format)");
    sub->add_option("--format", opts->format, "Output format")
        ->check(CLI::IsMember({"env", "plain", "json"}))
        ->capture_default_str();

    return Command{sub, [&config, io, opts]() {
        auto map = read_configured(config);
        if (!map) {
            return report(io, map.error());
        }

        if (opts->format == "json") {
            io.out << dotenv::to_json(*map).dump(2) << '\n';
        } else if (opts->format == "plain" || opts->line_numbers || config.line_numbers) {
            map->emit(io.out, opts->line_numbers || config.line_numbers);
        } else {
            io.out << dotenv::marshal(*map);
        }
        return 0;
    }};
}

// ---------------------------------------------------------------------------
// get command
// ---------------------------------------------------------------------------

auto register_get_command(CLI::App& app, const Config& config, Output io) -> Command {
    auto key = std::make_shared<std::string>();

    auto* sub = app.add_subcommand("get", "Print the value of one variable");
    sub->add_option("key", *key, "Variable name")->required();

    return Command{sub, [&config, io, key]() {
        auto map = read_configured(config);
        if (!map) {
            return report(io, map.error());
        }

        auto entry = map->get(*key);
        if (!entry) {
            io.err << "dotenvpp: " << *key << " is not defined\n";
            return 1;
        }
        io.out << entry->value << '\n';
        return 0;
    }};
}

// ---------------------------------------------------------------------------
// exec command
// ---------------------------------------------------------------------------

auto register_exec_command(CLI::App& app, const Config& config, Output io) -> Command {
    auto overload = std::make_shared<bool>(false);

    auto* sub = app.add_subcommand("exec", "Run a command with the variables loaded");
    sub->add_flag("-o,--overload", *overload,
                  "Replace variables that are already set");
    // Everything from the first positional on is the child's command line.
    sub->prefix_command();

    return Command{sub, [&config, io, overload, sub]() {
        auto command_line = sub->remaining();
        if (!command_line.empty() && command_line.front() == "--") {
            command_line.erase(command_line.begin());
        }
        if (command_line.empty()) {
            return report(io, make_error(ErrorCode::InvalidArgument,
                                         "exec requires a command to run"));
        }

        const auto& command = command_line.front();
        std::vector<std::string> args(command_line.begin() + 1, command_line.end());

        auto mode = (*overload || config.overload) ? infra::MergeMode::Overwrite
                                                   : infra::MergeMode::Preserve;

        auto status = infra::exec(config_files(config), command, args,
                                  process_environment(), mode, config.expand);
        if (!status) {
            return report(io, status.error());
        }
        return *status;
    }};
}

// ---------------------------------------------------------------------------
// write command
// ---------------------------------------------------------------------------

auto register_write_command(CLI::App& app, const Config& config, Output io) -> Command {
    auto output = std::make_shared<std::string>();

    auto* sub = app.add_subcommand("write", "Write the merged variables to a file");
    sub->add_option("-o,--output", *output, "Destination file")->required();

    return Command{sub, [&config, io, output]() {
        auto map = read_configured(config);
        if (!map) {
            return report(io, map.error());
        }
        if (auto written = infra::write(*map, *output); !written) {
            return report(io, written.error());
        }
        LOG_INFO("Wrote {} variables to {}", map->len(), *output);
        return 0;
    }};
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app, Output io) -> Command {
    auto* sub = app.add_subcommand("version", "Print version information");
    return Command{sub, [io]() {
        io.out << "dotenvpp " << DOTENVPP_VERSION_STRING << '\n';
        return 0;
    }};
}

} // namespace dotenvpp::cli
