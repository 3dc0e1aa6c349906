#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>

#include <regsync/error.h>
#include <regsync/policy.h>
#include <regsync/registry.h>
#include <regsync/retry.h>
#include <regsync/types.h>
#include <util/envvars.h>
#include <util/expected.h>

namespace regsync {

// a failed transfer or listing is retried at most once
constexpr int max_retry_attempts = 2;

// settings that can be provided by configuration files or on the command line
struct config_base {
    std::optional<bool> color;
    std::optional<int> jobs;
    std::optional<int> days;
    // seconds
    std::optional<int> api_timeout;
    // seconds
    std::optional<int> transfer_timeout;
    std::optional<int> retry_attempts;
    std::optional<int> retry_backoff_ms;
    // a severity name or "none"
    std::optional<std::string> scan_fail_severity;
    std::optional<bool> scan_on_push;
    // the aws and docker executables: a name looked up in PATH, or a path
    std::optional<std::string> aws;
    std::optional<std::string> docker;
};

// merge two config_base items
// if both have the same field set, choose the lhs value
config_base merge(const config_base& lhs, const config_base& rhs);

// get the default configuration
config_base default_config(const envvars::state& calling_env);

// read configuration from the user configuration file
// the location of the config file is determined using XDG_CONFIG_HOME or HOME
util::expected<config_base, std::string>
load_user_config(const envvars::state& calling_env);

// read configuration from /etc/regsync/config, or REGSYNC_SYSTEM_CONFIG
util::expected<config_base, std::string>
load_system_config(const envvars::state& calling_env);

// load config, in increasing order of precedence:
//  defaults < system config < user config < cli_config
// a config file that can't be read is an error.
util::expected<config_base, std::string>
load_config(const config_base& cli_config, const envvars::state& calling_env);

struct configuration {
    bool color = false;
    int jobs = 1;
    int days = 30;
    std::chrono::seconds api_timeout{120};
    std::chrono::seconds transfer_timeout{3600};
    retry_policy retry;
    std::optional<severity> scan_fail_severity = severity::critical;
    bool scan_on_push = true;
    // not set if the executable could not be found
    std::optional<std::filesystem::path> aws;
    std::optional<std::filesystem::path> docker;
};

// performs additional validation on parsed user and config file inputs
util::expected<configuration, error>
generate_configuration(const config_base& base, const envvars::state& env);

// the arguments of the sync command, as they were provided on the command
// line.
struct sync_request {
    std::string source_profile;
    std::string source_region;
    std::string destination_profile;
    std::string destination_region;
    std::optional<int> days;
    std::optional<std::string> include_repos;
    std::optional<std::string> exclude_repos;
    bool require_scan = false;
    std::optional<std::string> scan_fail_severity;
    bool ignore_tags = false;
    std::optional<int> jobs;
    bool dry_run = false;
};

// the validated settings of a sync run, immutable for the run.
struct sync_config {
    account source;
    account destination;
    regsync::policy policy;
    unsigned jobs = 1;
    retry_policy retry;
    std::chrono::milliseconds api_timeout;
    std::chrono::milliseconds transfer_timeout;
    bool scan_on_push = true;
    bool dry_run = false;
    std::filesystem::path aws;
    // not required for a dry run
    std::optional<std::filesystem::path> docker;
};

// validate the command line arguments against the configuration.
// any invalid or conflicting input is an error of kind config, and no
// sync_config is created.
util::expected<sync_config, error>
make_sync_config(const sync_request& request, const configuration& config);

// validate a profile and region pair
util::expected<account, error> make_account(const std::string& profile,
                                            const std::string& region);

namespace impl {
util::expected<config_base, std::string>
read_config_file(const std::filesystem::path& path,
                 const envvars::state& calling_env);
}

} // namespace regsync

template <> class fmt::formatter<regsync::sync_config> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    auto format(regsync::sync_config const& c, FmtContext& ctx) const {
        return fmt::format_to(
            ctx.out(),
            "sync_config({} -> {}, {}, jobs {}, {}, api-timeout {}ms, "
            "transfer-timeout {}ms, scan-on-push {}, dry-run {})",
            c.source, c.destination, c.policy, c.jobs, c.retry,
            c.api_timeout.count(), c.transfer_timeout.count(), c.scan_on_push,
            c.dry_run);
    }
};
