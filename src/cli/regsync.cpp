// vim: ts=4 sts=4 sw=4 et
#include <unistd.h>

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <regsync/config.h>
#include <regsync/log.h>
#include <regsync/settings.h>
#include <util/color.h>
#include <util/envvars.h>
#include <util/expected.h>
#include <util/fs.h>

#include "help.h"
#include "inventory.h"
#include "regsync.h"
#include "sync.h"
#include "terminal.h"

std::string help_footer();

regsync::global_settings::global_settings() : calling_environment(environ) {
}

int main(int argc, char** argv) {
    regsync::config_base cli_config;
    regsync::global_settings settings;
    bool print_version = false;

    CLI::App cli(fmt::format("regsync {}", REGSYNC_VERSION));
    cli.add_flag("-v,--verbose", settings.verbose, "enable verbose output");
    cli.add_flag("--verbose-auth", settings.verbose_auth,
                 "print authentication tokens in log messages");
    cli.add_flag_callback(
        "--no-color", [&cli_config]() -> void { cli_config.color = false; },
        "disable color output");
    cli.add_flag_callback(
        "--color", [&cli_config]() -> void { cli_config.color = true; },
        "enable color output");
    cli.add_flag("--version", print_version, "print version");

    cli.footer(help_footer);

    regsync::sync_args sync;
    regsync::inventory_args inventory;

    sync.add_cli(cli, settings);
    inventory.add_cli(cli, settings);

    CLI11_PARSE(cli, argc, argv);

    // By default there is no logging to the console
    //   user-friendly logging of errors and warnings is handled using
    //   term::error and term::warn
    // The level of logging is increased by adding --verbose
    spdlog::level::level_enum console_log_level = spdlog::level::off;
    if (settings.verbose == 1) {
        console_log_level = spdlog::level::info;
    } else if (settings.verbose == 2) {
        console_log_level = spdlog::level::debug;
    } else if (settings.verbose >= 3) {
        console_log_level = spdlog::level::trace;
    }
    // tokens are only printed in debug messages
    if (settings.verbose_auth) {
        regsync::set_reveal_sensitive(true);
        if (console_log_level > spdlog::level::debug) {
            console_log_level = spdlog::level::debug;
        }
    }
    regsync::init_log(console_log_level);

    if (auto bin = util::exe_path()) {
        spdlog::info("using regsync {}", bin->string());
    }

    // print the version and exit if the --version flag was passed
    if (print_version) {
        term::msg("{}", REGSYNC_VERSION);
        return 0;
    }

    // set the configuration according to defaults, cli options and config
    // files.
    auto full_config =
        regsync::load_config(cli_config, settings.calling_environment);
    if (!full_config) {
        term::error("invalid configuration: {}", full_config.error());
        return 1;
    }

    if (auto config = regsync::generate_configuration(
            *full_config, settings.calling_environment)) {
        settings.config = *config;
    } else {
        term::error("{}", config.error().message);
        return 1;
    }

    // toggle whether to use color output
    spdlog::info("color output is {}",
                 (settings.config.color ? "enabled" : "disabled"));
    color::set_color(settings.config.color);

    if (settings.config.aws) {
        spdlog::info("using aws {}", *settings.config.aws);
    }
    if (settings.config.docker) {
        spdlog::info("using docker {}", *settings.config.docker);
    }

    spdlog::info("{}", settings);

    switch (settings.mode) {
    case settings.sync:
        return regsync::sync_images(sync, settings);
    case settings.inventory:
        return regsync::list_inventory(inventory, settings);
    case settings.unset:
        term::msg("regsync version {}", REGSYNC_VERSION);
        term::msg("call '{} --help' for help", argv[0]);
        return 0;
    default:
        spdlog::warn("{}", (int)settings.mode);
        term::error("internal error, missing implementation for mode {}",
                    settings.mode);
        return 1;
    }

    return 0;
}

std::string help_footer() {
    using enum help::block::admonition;
    using help::lst;

    // clang-format off
    std::vector<help::item> items{
        help::block{none, "Use the --help flag in with sub-commands for more information."},
        help::linebreak{},
        help::block{xmpl, fmt::format("use the {} flag to generate more verbose output", lst{"-v"})},
        help::block{code,   "regsync -v  sync build us-east-1 deploy us-east-1    # info level logging"},
        help::block{code,   "regsync -vv sync build us-east-1 deploy us-east-1    # debug level logging"},
        help::linebreak{},
        help::block{xmpl, "get help with the sync command"},
        help::block{code,   "regsync sync --help"},
        help::linebreak{},
        help::block{note, "the exit code is 0 if every image was copied, 1 if the arguments or"},
        help::block{none, "configuration are invalid, 2 if an image could not be copied, 3 if an"},
        help::block{none, "account could not be listed, and 130 if interrupted."},
    };
    // clang-format on

    return help::render(items);
}
