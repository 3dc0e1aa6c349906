#pragma once

#include <string>

#include <fmt/color.h>

#include <util/envvars.h>

#define MAKE_COLOR(color)                                                      \
    static auto color() {                                                      \
        return fmt::emphasis::bold | fg(fmt::terminal_color::color);           \
    }                                                                          \
    template <typename S> auto color(const S& s) {                             \
        return use_color() ? fmt::format(color(), "{}", s)                     \
                           : fmt::format("{}", s);                             \
    }

namespace color {

// returns automatic color selection by inspecting environment variables and
// checking for tty:
//  - NO_COLOR set: off
//  - CLICOLOR_FORCE set and not 0: on
//  - otherwise on if stdout and stderr are both terminals
bool default_color(const envvars::state&);

// set color output on/off
void set_color(bool v);

// returns whether color output has been enabled using default_color or
// set_color
bool use_color();

MAKE_COLOR(red)
MAKE_COLOR(green)
MAKE_COLOR(yellow)
MAKE_COLOR(blue)
MAKE_COLOR(cyan)
MAKE_COLOR(white)

} // namespace color
