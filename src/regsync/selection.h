#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <regsync/inventory.h>
#include <regsync/policy.h>
#include <regsync/scan.h>
#include <regsync/types.h>

namespace regsync {

// the reasons for not copying an image
enum class rejection_reason {
    too_old,
    untagged,
    filtered,
    // the destination repository already has the digest
    present,
    scan_failed,
    scan_pending,
    scan_unavailable,
};

// a unit of work for the transfer driver: copy one image (all of its tags)
// to the repository of the same name in the destination account.
struct transfer_task {
    registry_image image;
    account destination;
    std::string repository;
    // the destination account has no repository with this name
    bool create_repository = false;
    // a short human readable description of why the image is copied
    std::string reason;
};

struct rejected_image {
    registry_image image;
    rejection_reason reason;
};

struct selection {
    // ordered by repository name, push time, then digest
    std::vector<transfer_task> tasks;
    std::vector<rejected_image> rejected;

    std::size_t count(rejection_reason r) const;
};

// decide which images of the source inventory are copied to the destination.
//
// the rules are applied in order:
//  1. images pushed more than policy.max_age_days before now are rejected
//  2. untagged images are rejected, unless policy.include_untagged
//  3. the repository name filter
//  4. images whose digest is already in the destination repository of the
//     same name are rejected, whatever their tags
//  5. if policy.require_scan, images whose scan did not pass are rejected
//
// the scan resolver is only queried for images that pass rules 1 to 4.
selection select(const inventory& source, const inventory& destination,
                 const policy& pol, scan_resolver& resolver, timestamp now);

} // namespace regsync

template <> class fmt::formatter<regsync::rejection_reason> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::rejection_reason r,
                          FmtContext& ctx) const {
        using enum regsync::rejection_reason;
        switch (r) {
        case too_old:
            return fmt::format_to(ctx.out(), "too old");
        case untagged:
            return fmt::format_to(ctx.out(), "untagged");
        case filtered:
            return fmt::format_to(ctx.out(), "filtered");
        case present:
            return fmt::format_to(ctx.out(), "already present");
        case scan_failed:
            return fmt::format_to(ctx.out(), "scan failed");
        case scan_pending:
            return fmt::format_to(ctx.out(), "scan pending");
        case scan_unavailable:
            return fmt::format_to(ctx.out(), "scan unavailable");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};

template <> class fmt::formatter<regsync::transfer_task> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    auto format(regsync::transfer_task const& t, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{} -> {}/{}", t.image,
                              t.destination, t.repository);
    }
};
