#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

#include <fmt/core.h>

#include <regsync/error.h>
#include <regsync/inventory.h>
#include <regsync/policy.h>
#include <regsync/registry.h>
#include <regsync/retry.h>
#include <regsync/scan.h>
#include <regsync/selection.h>
#include <regsync/transfer.h>
#include <regsync/types.h>
#include <util/expected.h>

namespace regsync {

// the images to copy from one account to another, computed from a snapshot of
// both accounts.
struct sync_plan {
    inventory source;
    inventory destination;
    selection selected;
};

// fetch the inventories of both accounts and select the images to copy.
// inventories are fetched with the retry policy applied to retryable errors.
// fails if either inventory can't be fetched.
util::expected<sync_plan, error> plan(const registry& source,
                                      const registry& destination,
                                      const policy& pol,
                                      scan_resolver& resolver,
                                      const retry_policy& retry,
                                      timestamp now);

enum class run_status { success, partial_failure, cancelled, fatal };

struct run_report {
    // the outcome of every task that was executed, in plan order
    std::vector<transfer_outcome> outcomes;
    std::vector<rejected_image> rejected;
    // tasks that were not started because the run was cancelled
    std::size_t not_scheduled = 0;
    bool cancelled = false;
    // set if the run could not start
    std::optional<error> fatal_error;

    std::size_t count(transfer_status s) const;
    std::size_t count(rejection_reason r) const;
    run_status status() const;
};

// called with the outcome of each task as it completes.
// calls are serialised, so the callback does not need to be thread safe.
using outcome_observer = std::function<void(const transfer_outcome&)>;

// polled before each task is started: once it returns true no more tasks are
// started, and tasks that are running are allowed to finish.
using cancellation_check = std::function<bool()>;

// execute the tasks of a plan on a pool of jobs workers.
// a failed task never stops the run.
run_report execute_plan(const sync_plan& plan, const transfer_driver& driver,
                        unsigned jobs, const cancellation_check& cancelled,
                        const outcome_observer& observer = {});

// a report for a run that failed before any task was executed
run_report fatal_report(error e);

// the exit code of the application for a run
//  0   success, including when there was nothing to do
//  2   at least one task failed
//  3   an inventory could not be fetched
//  130 the run was interrupted
int exit_code(const run_report& report);

} // namespace regsync

template <> class fmt::formatter<regsync::run_status> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::run_status s, FmtContext& ctx) const {
        using enum regsync::run_status;
        switch (s) {
        case success:
            return fmt::format_to(ctx.out(), "success");
        case partial_failure:
            return fmt::format_to(ctx.out(), "partial failure");
        case cancelled:
            return fmt::format_to(ctx.out(), "cancelled");
        case fatal:
            return fmt::format_to(ctx.out(), "fatal");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};
