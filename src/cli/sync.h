#pragma once
// vim: ts=4 sts=4 sw=4 et

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <regsync/settings.h>

#include "regsync.h"

namespace regsync {

struct sync_args {
    sync_request request;
    void add_cli(CLI::App&, global_settings& settings);
};

int sync_images(const sync_args& args, const global_settings& settings);

} // namespace regsync

template <> class fmt::formatter<regsync::sync_args> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::sync_args const& opts,
                          FmtContext& ctx) const {
        const auto& r = opts.request;
        return fmt::format_to(ctx.out(), "(sync {}:{} {}:{} .dry_run={})",
                              r.source_profile, r.source_region,
                              r.destination_profile, r.destination_region,
                              r.dry_run);
    }
};
