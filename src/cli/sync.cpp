// vim: ts=4 sts=4 sw=4 et

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include <barkeep/barkeep.h>
#include <CLI/CLI.hpp>
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <regsync/aws.h>
#include <regsync/coordinator.h>
#include <regsync/credentials.h>
#include <regsync/docker.h>
#include <regsync/executor.h>
#include <regsync/registry.h>
#include <regsync/scan.h>
#include <regsync/selection.h>
#include <regsync/settings.h>
#include <regsync/transfer.h>
#include <util/color.h>
#include <util/fs.h>
#include <util/signal.h>

#include "help.h"
#include "sync.h"
#include "terminal.h"

namespace regsync {

std::string sync_footer();

void sync_args::add_cli(CLI::App& cli, global_settings& settings) {
    auto* sync_cli = cli.add_subcommand(
        "sync", "copy recent images from one registry account to another");
    sync_cli
        ->add_option("source-profile", request.source_profile,
                     "the credential profile of the source account")
        ->required();
    sync_cli
        ->add_option("source-region", request.source_region,
                     "the region of the source registry")
        ->required();
    sync_cli
        ->add_option("destination-profile", request.destination_profile,
                     "the credential profile of the destination account")
        ->required();
    sync_cli
        ->add_option("destination-region", request.destination_region,
                     "the region of the destination registry")
        ->required();
    sync_cli->add_option(
        "-d,--days", request.days,
        "only copy images pushed in the last N days (default 30)");
    sync_cli->add_option(
        "--include-repos", request.include_repos,
        "a comma separated list of the only repositories to copy");
    sync_cli->add_option("--exclude-repos", request.exclude_repos,
                         "a comma separated list of repositories to skip");
    sync_cli->add_flag("-s,--require-scan", request.require_scan,
                       "only copy images with a vulnerability scan that "
                       "passed");
    sync_cli->add_option(
        "--scan-fail-severity", request.scan_fail_severity,
        "scans with findings at or above this severity fail: informational, "
        "low, medium, high, critical or none (default critical)");
    sync_cli->add_flag("-t,--ignore-tags", request.ignore_tags,
                       "also copy images that have no tags");
    sync_cli->add_option("-j,--jobs", request.jobs,
                         "the number of images to copy concurrently");
    sync_cli->add_flag("--dry-run", request.dry_run,
                       "print the images that would be copied, and copy "
                       "nothing");
    sync_cli->callback([&settings]() { settings.mode = cli_mode::sync; });

    sync_cli->footer(sync_footer);
}

namespace impl {

void print_plan(const sync_plan& plan) {
    const auto& tasks = plan.selected.tasks;
    term::msg("{} images to copy from {} to {}", tasks.size(),
              plan.source.owner, plan.destination.owner);
    for (auto& task : tasks) {
        term::msg("  {}{}  {}", color::green(task),
                  task.create_repository ? " (new repository)" : "",
                  task.reason);
    }
    const auto& rejected = plan.selected.rejected;
    if (!rejected.empty()) {
        term::msg("{} images are not copied", rejected.size());
        for (auto& r : rejected) {
            term::msg("  {}  {}", r.image, color::yellow(r.reason));
        }
    }
}

void print_summary(const run_report& report) {
    term::msg("{} copied, {} skipped, {} failed",
              report.count(transfer_status::copied),
              report.count(transfer_status::skipped),
              report.count(transfer_status::failed));
    const auto present = report.count(rejection_reason::present);
    term::msg("{} already present in the destination, {} rejected by policy",
              present, report.rejected.size() - present);

    for (auto& o : report.outcomes) {
        if (o.status == transfer_status::failed && o.failure) {
            term::error("{}: {}", o.task, *o.failure);
            if (!o.failure->detail.empty()) {
                spdlog::info("{}: {}", o.task, o.failure->detail);
            }
        }
    }
    if (report.cancelled) {
        term::warn("interrupted by {}: {} images were not copied",
                   util::signal_name(util::last_signal_raised()),
                   report.not_scheduled);
    }
}

} // namespace impl

int sync_images(const sync_args& args, const global_settings& settings) {
    namespace bk = barkeep;

    spdlog::info("{}", args);

    auto config = make_sync_config(args.request, settings.config);
    if (!config) {
        term::error("{}", config.error().message);
        return 1;
    }
    spdlog::info("{}", *config);

    const registry source = aws::aws_registry(
        config->source, config->aws, config->api_timeout, config->scan_on_push);
    const registry destination =
        aws::aws_registry(config->destination, config->aws,
                          config->api_timeout, config->scan_on_push);

    util::set_signal_catcher();

    scan_resolver resolver(source, config->policy.scan_fail_severity);
    auto plan = regsync::plan(source, destination, config->policy, resolver,
                              config->retry, std::chrono::system_clock::now());
    if (!plan) {
        util::reset_signal_catcher();
        term::error("unable to determine the images to copy: {}",
                    plan.error());
        return exit_code(fatal_report(plan.error()));
    }
    spdlog::info("sync: {} scan queries", resolver.queries());

    if (config->dry_run) {
        util::reset_signal_catcher();
        impl::print_plan(*plan);
        return 0;
    }

    // docker login state is kept in a private configuration path, so that
    // the credentials of the calling user are not modified.
    const docker::docker_executor docker(*config->docker, util::make_temp_dir(),
                                         config->api_timeout,
                                         config->transfer_timeout);

    credential_cache source_credentials(source);
    credential_cache destination_credentials(destination);
    const transfer_driver driver(docker, destination, source_credentials,
                                 destination_credentials, config->retry);

    const int ntasks = plan->selected.tasks.size();
    std::atomic<int> finished{0};
    const bool show_progress =
        ntasks > 0 && settings.verbose == 0 && isatty(fileno(stdout));
    auto bar = bk::ProgressBar(
        &finished, {
                       .total = std::max(1, ntasks), // avoid divide-by-zero
                       .message = "copying images",
                       .style = color::use_color() ? bk::ProgressBarStyle::Rich
                                                   : bk::ProgressBarStyle::Bars,
                       .no_tty = !isatty(fileno(stdout)),
                       .show = false,
                   });
    if (show_progress) {
        bar->show();
    }

    auto report = execute_plan(
        *plan, driver, config->jobs, []() { return util::signal_raised(); },
        [&finished](const transfer_outcome& o) {
            ++finished;
            spdlog::debug("sync: {} {}", o.task, o.status);
        });

    if (show_progress) {
        bar->done();
    }
    util::reset_signal_catcher();

    impl::print_summary(report);

    const auto code = exit_code(report);
    spdlog::info("sync: {} (exit code {})", report.status(), code);
    return code;
}

std::string sync_footer() {
    using enum help::block::admonition;
    using help::lst;

    // clang-format off
    std::vector<help::item> items{
        help::block{none, "Copy the images pushed to the source account in the last 30 days that"},
        help::block{none, "are not in the destination account."},
        help::linebreak{},
        help::block{xmpl, "copy images between two accounts in the same region"},
        help::block{code,   "regsync sync build us-east-1 deploy us-east-1"},
        help::linebreak{},
        help::block{xmpl, fmt::format("print the images that would be copied with {}", lst{"--dry-run"})},
        help::block{code,   "regsync sync --dry-run build us-east-1 deploy us-east-1"},
        help::linebreak{},
        help::block{xmpl, "copy images from two repositories, pushed in the last week, that passed a scan"},
        help::block{code,   "regsync sync -d 7 -s --include-repos=app,worker build us-east-1 deploy eu-west-1"},
        help::linebreak{},
        help::block{note, fmt::format("{} and {} can not be used together.", lst{"--include-repos"}, lst{"--exclude-repos"})},
        help::block{note, fmt::format("untagged images are only copied with {}, and are given the tag", lst{"--ignore-tags"}),
                          "untagged-<digest> in the destination."},
    };
    // clang-format on

    return help::render(items);
}

} // namespace regsync
