#pragma once

#include <optional>
#include <set>
#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <regsync/registry.h>

namespace regsync {

// selects repositories by name: either an allow list or a deny list, never
// both.
struct name_filter {
    enum class mode { none, allow, deny };
    using enum mode;

    mode kind = none;
    std::set<std::string> names;

    static name_filter allow_list(std::set<std::string> names) {
        return {allow, std::move(names)};
    }
    static name_filter deny_list(std::set<std::string> names) {
        return {deny, std::move(names)};
    }

    bool admits(const std::string& repository) const {
        switch (kind) {
        case allow:
            return names.contains(repository);
        case deny:
            return !names.contains(repository);
        case none:
            break;
        }
        return true;
    }
};

// the rules that decide which images are copied.
// immutable for the duration of a run.
struct policy {
    // images pushed more than this many days ago are not copied
    int max_age_days = 30;
    name_filter filter;
    // only copy images whose scan passed
    bool require_scan = false;
    // copy images that have no tags
    bool include_untagged = false;
    // scans with findings at or above this severity fail.
    // if not set, complete scans always pass.
    std::optional<severity> scan_fail_severity = severity::critical;
};

} // namespace regsync

template <> class fmt::formatter<regsync::name_filter> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    auto format(regsync::name_filter const& f, FmtContext& ctx) const {
        using enum regsync::name_filter::mode;
        switch (f.kind) {
        case allow:
            return fmt::format_to(ctx.out(), "allow {}", f.names);
        case deny:
            return fmt::format_to(ctx.out(), "deny {}", f.names);
        case none:
            break;
        }
        return fmt::format_to(ctx.out(), "none");
    }
};

template <> class fmt::formatter<regsync::policy> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    auto format(regsync::policy const& p, FmtContext& ctx) const {
        return fmt::format_to(
            ctx.out(),
            "policy(days {}, filter {}, require-scan {}, untagged {}, "
            "scan-fail-severity {})",
            p.max_age_days, p.filter, p.require_scan, p.include_untagged,
            p.scan_fail_severity ? fmt::format("{}", *p.scan_fail_severity)
                                 : std::string("none"));
    }
};
