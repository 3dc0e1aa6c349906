#pragma once

#include <optional>

#include <fmt/core.h>

#include <regsync/credentials.h>
#include <regsync/error.h>
#include <regsync/executor.h>
#include <regsync/registry.h>
#include <regsync/retry.h>
#include <regsync/selection.h>

namespace regsync {

enum class transfer_status {
    copied,
    // the destination had the image when the task was executed
    skipped,
    failed
};

struct transfer_outcome {
    transfer_task task;
    transfer_status status = transfer_status::failed;
    std::optional<error> failure;
    unsigned attempts = 0;
};

// Copies images from the source to the destination account.
//
// Each attempt authenticates with both accounts, skips images that are
// already in the destination, creates the destination repository if
// required, then pulls the image by digest, tags it with every destination
// reference and pushes the references. Local copies are always removed.
//
// Failed attempts are retried according to the retry policy if the error is
// retryable, or if the registry rejected a cached token while pulling or
// pushing: the token is refreshed before the next attempt.
class transfer_driver {
  public:
    transfer_driver(executor exec, registry destination,
                    credential_cache& source_credentials,
                    credential_cache& destination_credentials,
                    retry_policy retry);

    // safe to call concurrently for different tasks
    transfer_outcome execute(const transfer_task& task) const;

  private:
    executor executor_;
    registry destination_;
    credential_cache& source_credentials_;
    credential_cache& destination_credentials_;
    retry_policy retry_;

    // stale_token is set if a cached token was rejected, and pushed is set
    // once any reference has been pushed by this or an earlier attempt
    util::expected<transfer_status, error> attempt(const transfer_task& task,
                                                   bool& stale_token,
                                                   bool& pushed) const;
};

} // namespace regsync

template <> class fmt::formatter<regsync::transfer_status> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::transfer_status s, FmtContext& ctx) const {
        using enum regsync::transfer_status;
        switch (s) {
        case copied:
            return fmt::format_to(ctx.out(), "copied");
        case skipped:
            return fmt::format_to(ctx.out(), "skipped");
        case failed:
            return fmt::format_to(ctx.out(), "failed");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};
