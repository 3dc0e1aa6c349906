// vim: ts=4 sts=4 sw=4 et
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <util/color.h>

#include "help.h"

namespace help {

block::block(std::string msg) : kind(none), lines{std::move(msg)} {
}

std::string render(const linebreak&) {
    return "";
}

std::string render(const block& b) {
    using enum help::block::admonition;
    std::string result{};
    switch (b.kind) {
    case none:
    case code:
        break;
    case note:
        result += fmt::format("{} - ", ::color::cyan("Note"));
        break;
    case xmpl:
        result += fmt::format("{} - ", ::color::blue("Example"));
        break;
    case warn:
        result += fmt::format("{} - ", ::color::red("Warning"));
        break;
    }
    bool first = true;
    for (auto& l : b.lines) {
        if (!first) {
            result += "\n";
        }
        result += b.kind == code ? fmt::format("  {}", ::color::white(l)) : l;
        first = false;
    }

    return result;
}

std::string render(const std::vector<item>& items) {
    return fmt::format("{}", fmt::join(items, "\n"));
}

} // namespace help
