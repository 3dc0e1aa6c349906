#pragma once

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace regsync {

void init_log(spdlog::level::level_enum console_log_level);

// control whether values wrapped in sensitive are printed in log messages.
// off by default: enabled with the --verbose-auth flag.
void set_reveal_sensitive(bool reveal);
bool reveal_sensitive();

// wraps a value, e.g. a registry token, that must not appear in logs unless
// explicitly requested.
template <typename T> struct sensitive {
    const T& value;
};

template <typename T> sensitive(const T&) -> sensitive<T>;

} // namespace regsync

template <typename T> class fmt::formatter<regsync::sensitive<T>> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    // the placeholder has a fixed width, so the length of the value is not
    // leaked either
    auto format(regsync::sensitive<T> const& s, FmtContext& ctx) const {
        if (regsync::reveal_sensitive()) {
            return fmt::format_to(ctx.out(), "{}", s.value);
        }
        return fmt::format_to(ctx.out(), "XXXXXXXX");
    }
};
