#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include <regsync/coordinator.h>

namespace regsync {

static util::expected<inventory, error>
fetch_with_retry(const registry& reg, const retry_policy& retry) {
    return retry.apply([&reg](unsigned) { return fetch_inventory(reg); },
                       [](const error& e) { return e.retryable(); });
}

util::expected<sync_plan, error> plan(const registry& source,
                                      const registry& destination,
                                      const policy& pol,
                                      scan_resolver& resolver,
                                      const retry_policy& retry,
                                      timestamp now) {
    spdlog::info("plan: {} -> {} with {}", source.owner(),
                 destination.owner(), pol);

    auto src = fetch_with_retry(source, retry);
    if (!src) {
        return util::unexpected(src.error());
    }
    auto dst = fetch_with_retry(destination, retry);
    if (!dst) {
        return util::unexpected(dst.error());
    }

    auto selected = select(*src, *dst, pol, resolver, now);
    return sync_plan{std::move(*src), std::move(*dst), std::move(selected)};
}

std::size_t run_report::count(transfer_status s) const {
    return std::count_if(outcomes.begin(), outcomes.end(),
                         [s](const auto& o) { return o.status == s; });
}

std::size_t run_report::count(rejection_reason r) const {
    return std::count_if(rejected.begin(), rejected.end(),
                         [r](const auto& x) { return x.reason == r; });
}

run_status run_report::status() const {
    if (fatal_error) {
        return run_status::fatal;
    }
    if (cancelled) {
        return run_status::cancelled;
    }
    if (count(transfer_status::failed)) {
        return run_status::partial_failure;
    }
    return run_status::success;
}

run_report execute_plan(const sync_plan& plan, const transfer_driver& driver,
                        unsigned jobs, const cancellation_check& cancelled,
                        const outcome_observer& observer) {
    const auto& tasks = plan.selected.tasks;
    const auto ntasks = tasks.size();
    jobs = std::clamp<unsigned>(jobs, 1u, std::max<std::size_t>(ntasks, 1));

    spdlog::info("execute_plan: {} tasks with {} workers", ntasks, jobs);

    // outcomes are stored by task index, so that completion order does not
    // affect the report
    std::vector<std::optional<transfer_outcome>> outcomes(ntasks);
    std::atomic<std::size_t> next_task{0};
    // sticky: cancellation checks may reset the condition that they report
    std::atomic<bool> stop{false};
    std::mutex observer_mutex;

    auto worker = [&]() {
        while (true) {
            if (stop.load() || (cancelled && cancelled())) {
                stop.store(true);
                break;
            }
            const auto i = next_task.fetch_add(1);
            if (i >= ntasks) {
                break;
            }
            auto outcome = driver.execute(tasks[i]);
            if (observer) {
                std::lock_guard<std::mutex> lock(observer_mutex);
                observer(outcome);
            }
            outcomes[i] = std::move(outcome);
        }
    };

    if (jobs == 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        for (unsigned w = 0; w < jobs; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& w : workers) {
            w.join();
        }
    }

    run_report report;
    report.rejected = plan.selected.rejected;
    for (auto& o : outcomes) {
        if (o) {
            report.outcomes.push_back(std::move(*o));
        } else {
            ++report.not_scheduled;
        }
    }
    report.cancelled = stop.load() && report.not_scheduled > 0;

    spdlog::info("execute_plan: {} copied, {} skipped, {} failed, {} not "
                 "scheduled",
                 report.count(transfer_status::copied),
                 report.count(transfer_status::skipped),
                 report.count(transfer_status::failed), report.not_scheduled);

    return report;
}

run_report fatal_report(error e) {
    run_report report;
    report.fatal_error = std::move(e);
    return report;
}

int exit_code(const run_report& report) {
    switch (report.status()) {
    case run_status::success:
        return 0;
    case run_status::partial_failure:
        return 2;
    case run_status::fatal:
        return 3;
    case run_status::cancelled:
        return 130;
    }
    return 1;
}

} // namespace regsync
