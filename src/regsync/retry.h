#pragma once

#include <chrono>
#include <thread>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <regsync/error.h>

namespace regsync {

// bounded retries of an operation
struct retry_policy {
    // the total number of attempts: 1 means no retry
    unsigned max_attempts = 2;
    // the time to wait between attempts
    std::chrono::milliseconds backoff{0};

    // call f(attempt) with attempt = 1, 2, ... until it succeeds, returns an
    // error for which should_retry returns false, or max_attempts have been
    // made. returns the result of the last attempt.
    template <typename F, typename P>
    auto apply(F&& f, P&& should_retry) const {
        unsigned attempt = 1;
        auto result = f(attempt);
        while (!result && attempt < max_attempts &&
               should_retry(result.error())) {
            spdlog::debug("retry_policy: attempt {} of {} failed: {}", attempt,
                          max_attempts, result.error());
            if (backoff.count() > 0) {
                std::this_thread::sleep_for(backoff);
            }
            ++attempt;
            result = f(attempt);
        }
        return result;
    }
};

} // namespace regsync

template <> class fmt::formatter<regsync::retry_policy> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    auto format(regsync::retry_policy const& r, FmtContext& ctx) const {
        return fmt::format_to(ctx.out(), "retry(attempts {}, backoff {}ms)",
                              r.max_attempts, r.backoff.count());
    }
};
