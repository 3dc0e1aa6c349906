#pragma once
// vim: ts=4 sts=4 sw=4 et

#include <string>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "regsync.h"

namespace regsync {

struct inventory_args {
    std::string profile;
    std::string region;
    void add_cli(CLI::App&, global_settings& settings);
};

int list_inventory(const inventory_args& args,
                   const global_settings& settings);

} // namespace regsync

template <> class fmt::formatter<regsync::inventory_args> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::inventory_args const& opts,
                          FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "(inventory {}:{})", opts.profile,
                              opts.region);
    }
};
