// vim: ts=4 sts=4 sw=4 et
#pragma once

#include <cstdint>

#include <fmt/core.h>

#include <regsync/settings.h>
#include <util/envvars.h>

namespace regsync {

enum class cli_mode : std::uint32_t { unset, sync, inventory };

struct global_settings {
    global_settings();

    // the environment variables that were set when the application is started.
    const envvars::state calling_environment;

    // the verbosity level: used to set spdlog level
    int verbose = 0;

    // print authentication tokens in log messages
    bool verbose_auth = false;

    // the command mode
    using enum cli_mode;
    cli_mode mode = unset;

    // configuration options: merged from config file, CLI options and defaults
    configuration config;
};

} // namespace regsync

template <> class fmt::formatter<regsync::cli_mode> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::cli_mode mode, FmtContext& ctx) const {
        using enum regsync::cli_mode;
        switch (mode) {
        case unset:
            return format_to(ctx.out(), "unset");
        case sync:
            return format_to(ctx.out(), "sync");
        case inventory:
            return format_to(ctx.out(), "inventory");
        }
        return format_to(ctx.out(), "unknown");
    }
};

template <> class fmt::formatter<regsync::global_settings> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::global_settings const& opts,
                          FmtContext& ctx) const {
        return fmt::format_to(ctx.out(),
                              "global_settings(mode {}, verbose {}, "
                              "verbose-auth {})",
                              opts.mode, opts.verbose, opts.verbose_auth);
    }
};
