#pragma once

#include <string>

#include <fmt/core.h>

namespace regsync {

enum class error_kind {
    // credentials are invalid, expired or missing
    auth,
    // the credentials are valid, but do not grant access to the resource
    permission_denied,
    // a transient network or service failure, including time outs
    registry_unavailable,
    // a failure moving image data with the transfer executor
    transfer,
    not_found,
    already_exists,
    // invalid user input, detected before any registry call is made
    config,
    internal
};

struct error {
    error_kind kind = error_kind::internal;
    // the user facing description of the error
    std::string message;
    // raw information from the source of the error, e.g. stderr of a
    // sub-process or the body of an HTTP response
    std::string detail;

    // errors that may succeed if the operation is attempted again
    bool retryable() const {
        return kind == error_kind::registry_unavailable ||
               kind == error_kind::transfer;
    }
};

} // namespace regsync

template <> class fmt::formatter<regsync::error_kind> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::error_kind kind, FmtContext& ctx) const {
        using enum regsync::error_kind;
        switch (kind) {
        case auth:
            return fmt::format_to(ctx.out(), "auth");
        case permission_denied:
            return fmt::format_to(ctx.out(), "permission-denied");
        case registry_unavailable:
            return fmt::format_to(ctx.out(), "registry-unavailable");
        case transfer:
            return fmt::format_to(ctx.out(), "transfer");
        case not_found:
            return fmt::format_to(ctx.out(), "not-found");
        case already_exists:
            return fmt::format_to(ctx.out(), "already-exists");
        case config:
            return fmt::format_to(ctx.out(), "config");
        case internal:
            return fmt::format_to(ctx.out(), "internal");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};

template <> class fmt::formatter<regsync::error> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::error const& e, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "{} ({})", e.message, e.kind);
    }
};
