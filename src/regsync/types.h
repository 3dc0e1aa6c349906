#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <string>

#include <fmt/core.h>

namespace regsync {

using timestamp = std::chrono::system_clock::time_point;

// a registry account, addressed by a named credential profile and a region
struct account {
    std::string profile;
    std::string region;

    auto operator<=>(const account&) const = default;
};

// an image in a repository of a registry account.
// identity is (repository, digest): a digest never changes once created, and
// entries with the same digest and different tags are the same image.
struct registry_image {
    std::string repository;
    std::string digest;
    std::set<std::string> tags;
    timestamp pushed_at;
    account owner;

    bool untagged() const {
        return tags.empty();
    }
};

enum class scan_verdict { passed, failed, pending, unavailable };

// a reference to an image in a registry:
//      endpoint/repository:tag
//      endpoint/repository@digest
struct image_ref {
    std::string endpoint;
    std::string repository;
    std::optional<std::string> tag;
    std::optional<std::string> digest;

    std::string string() const;
};

// the tag given to images that have no tags when copied, because docker can
// not push an image without a tag: "untagged-" followed by the first 12 hex
// characters of the digest.
std::string untagged_tag(const std::string& digest);

// the digest without the "sha256:" algorithm prefix, truncated to n
// characters
std::string short_digest(const std::string& digest, std::size_t n = 12);

} // namespace regsync

template <> class fmt::formatter<regsync::account> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::account const& a, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}:{}", a.profile, a.region);
    }
};

template <> class fmt::formatter<regsync::scan_verdict> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::scan_verdict v, FmtContext& ctx) const {
        using enum regsync::scan_verdict;
        switch (v) {
        case passed:
            return fmt::format_to(ctx.out(), "passed");
        case failed:
            return fmt::format_to(ctx.out(), "failed");
        case pending:
            return fmt::format_to(ctx.out(), "pending");
        case unavailable:
            return fmt::format_to(ctx.out(), "unavailable");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};

template <> class fmt::formatter<regsync::image_ref> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    auto format(regsync::image_ref const& r, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", r.string());
    }
};

template <> class fmt::formatter<regsync::registry_image> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    auto format(regsync::registry_image const& i, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}@{}",
                              i.repository, regsync::short_digest(i.digest));
    }
};
