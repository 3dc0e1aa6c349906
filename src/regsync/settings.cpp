#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include <regsync/parse.h>
#include <regsync/settings.h>
#include <util/color.h>
#include <util/envvars.h>
#include <util/fs.h>
#include <util/strings.h>

namespace regsync {

const std::string config_file_default =
    R"(
# regsync configuration file
# lines starting with '#' are comments
# ${VAR} is replaced with the value of the environment variable VAR

# by default regsync will choose whether to use color based on your environment.
#color = true
#color = false

# the number of images to copy concurrently
#jobs = 1

# images pushed more than this many days ago are not copied
#days = 30

# time outs, in seconds, of registry API calls and of image pulls and pushes
#api-timeout = 120
#transfer-timeout = 3600

# the total number of attempts made to copy an image, and the pause between
# attempts in milliseconds
#retry-attempts = 2
#retry-backoff-ms = 0

# scans with findings at or above this severity fail: one of
# informational, low, medium, high, critical or none
#scan-fail-severity = critical

# enable scan on push for repositories created in the destination account
#scan-on-push = true

# the aws and docker executables
#aws = aws
#docker = ${HOME}/bin/docker
)";

template <typename T>
static std::optional<T> prefer(const std::optional<T>& lhs,
                               const std::optional<T>& rhs) {
    return lhs ? lhs : rhs;
}

config_base merge(const config_base& lhs, const config_base& rhs) {
    return {.color = prefer(lhs.color, rhs.color),
            .jobs = prefer(lhs.jobs, rhs.jobs),
            .days = prefer(lhs.days, rhs.days),
            .api_timeout = prefer(lhs.api_timeout, rhs.api_timeout),
            .transfer_timeout =
                prefer(lhs.transfer_timeout, rhs.transfer_timeout),
            .retry_attempts = prefer(lhs.retry_attempts, rhs.retry_attempts),
            .retry_backoff_ms =
                prefer(lhs.retry_backoff_ms, rhs.retry_backoff_ms),
            .scan_fail_severity =
                prefer(lhs.scan_fail_severity, rhs.scan_fail_severity),
            .scan_on_push = prefer(lhs.scan_on_push, rhs.scan_on_push),
            .aws = prefer(lhs.aws, rhs.aws),
            .docker = prefer(lhs.docker, rhs.docker)};
}

config_base default_config(const envvars::state& env) {
    return {
        .color = color::default_color(env),
        .jobs = 1,
        .days = 30,
        .api_timeout = 120,
        .transfer_timeout = 3600,
        .retry_attempts = 2,
        .retry_backoff_ms = 0,
        .scan_fail_severity = "critical",
        .scan_on_push = true,
        .aws = "aws",
        .docker = "docker",
    };
}

util::expected<configuration, error>
generate_configuration(const config_base& base, const envvars::state& env) {
    configuration config;

    auto config_error = [](std::string msg) {
        return util::unexpected(error{error_kind::config, std::move(msg), {}});
    };

    config.color = base.color.value_or(false);
    config.jobs = base.jobs.value_or(config.jobs);
    config.days = base.days.value_or(config.days);
    if (base.api_timeout) {
        config.api_timeout = std::chrono::seconds(*base.api_timeout);
    }
    if (base.transfer_timeout) {
        config.transfer_timeout = std::chrono::seconds(*base.transfer_timeout);
    }
    if (base.retry_attempts) {
        if (*base.retry_attempts < 1 ||
            *base.retry_attempts > max_retry_attempts) {
            return config_error(fmt::format(
                "retry-attempts must be between 1 and {}, {} was requested",
                max_retry_attempts, *base.retry_attempts));
        }
        config.retry.max_attempts = *base.retry_attempts;
    }
    if (base.retry_backoff_ms) {
        config.retry.backoff =
            std::chrono::milliseconds(*base.retry_backoff_ms);
    }
    if (base.scan_fail_severity) {
        auto s = parse_severity_threshold(*base.scan_fail_severity);
        if (!s) {
            return config_error(
                fmt::format("invalid scan-fail-severity: {}", s.error()));
        }
        config.scan_fail_severity = *s;
    }
    config.scan_on_push = base.scan_on_push.value_or(config.scan_on_push);

    config.aws = util::find_tool(base.aws.value_or("aws"), env);
    if (!config.aws) {
        spdlog::warn("generate_configuration: unable to find the aws "
                     "executable '{}'",
                     base.aws.value_or("aws"));
    }
    config.docker = util::find_tool(base.docker.value_or("docker"), env);
    if (!config.docker) {
        spdlog::warn("generate_configuration: unable to find the docker "
                     "executable '{}'",
                     base.docker.value_or("docker"));
    }

    return config;
}

util::expected<account, error> make_account(const std::string& profile,
                                            const std::string& region) {
    if (!valid_profile(profile)) {
        return util::unexpected(
            error{error_kind::config,
                  fmt::format("invalid profile name '{}': only letters, "
                              "digits, '-' and '_' are allowed",
                              profile),
                  {}});
    }
    if (!valid_region(region)) {
        return util::unexpected(
            error{error_kind::config,
                  fmt::format("invalid region '{}': only lower case letters, "
                              "digits and '-' are allowed",
                              region),
                  {}});
    }
    return account{profile, region};
}

util::expected<sync_config, error>
make_sync_config(const sync_request& request, const configuration& config) {
    auto config_error = [](std::string msg) {
        return util::unexpected(error{error_kind::config, std::move(msg), {}});
    };

    auto source = make_account(request.source_profile, request.source_region);
    if (!source) {
        return util::unexpected(source.error());
    }
    auto destination =
        make_account(request.destination_profile, request.destination_region);
    if (!destination) {
        return util::unexpected(destination.error());
    }
    if (*source == *destination) {
        return config_error(fmt::format(
            "the source and destination are the same account {}", *source));
    }

    if (request.include_repos && request.exclude_repos) {
        return config_error(
            "--include-repos and --exclude-repos can not be used together");
    }

    policy pol;

    pol.max_age_days = request.days.value_or(config.days);
    if (pol.max_age_days < 1) {
        return config_error(fmt::format(
            "the number of days must be at least 1, {} was requested",
            pol.max_age_days));
    }

    if (request.include_repos) {
        auto names = parse_name_list(*request.include_repos);
        if (names.empty()) {
            return config_error("--include-repos requires at least one name");
        }
        pol.filter = name_filter::allow_list(std::move(names));
    } else if (request.exclude_repos) {
        auto names = parse_name_list(*request.exclude_repos);
        if (names.empty()) {
            return config_error("--exclude-repos requires at least one name");
        }
        pol.filter = name_filter::deny_list(std::move(names));
    }

    pol.require_scan = request.require_scan;
    pol.include_untagged = request.ignore_tags;
    pol.scan_fail_severity = config.scan_fail_severity;
    if (request.scan_fail_severity) {
        auto s = parse_severity_threshold(*request.scan_fail_severity);
        if (!s) {
            return config_error(s.error());
        }
        pol.scan_fail_severity = *s;
    }

    const int jobs = request.jobs.value_or(config.jobs);
    if (jobs < 1) {
        return config_error(fmt::format(
            "the number of jobs must be at least 1, {} was requested", jobs));
    }
    if (config.retry.max_attempts < 1 ||
        config.retry.max_attempts > unsigned(max_retry_attempts)) {
        return config_error(
            fmt::format("retry-attempts must be between 1 and {}",
                        max_retry_attempts));
    }

    if (!config.aws) {
        return config_error("the aws executable could not be found");
    }
    if (!config.docker && !request.dry_run) {
        return config_error("the docker executable could not be found");
    }

    return sync_config{
        .source = std::move(*source),
        .destination = std::move(*destination),
        .policy = std::move(pol),
        .jobs = static_cast<unsigned>(jobs),
        .retry = config.retry,
        .api_timeout = config.api_timeout,
        .transfer_timeout = config.transfer_timeout,
        .scan_on_push = config.scan_on_push,
        .dry_run = request.dry_run,
        .aws = *config.aws,
        .docker = config.docker,
    };
}

util::expected<config_base, std::string>
load_user_config(const envvars::state& calling_env) {
    namespace fs = std::filesystem;

    auto home_env = calling_env.get("HOME");
    auto xdg_env = calling_env.get("XDG_CONFIG_HOME");
    // return an empty config if no configuration path can be determined
    if (!home_env && !xdg_env) {
        spdlog::warn("unable to find default configuration location, neither "
                     "HOME nor XDG_CONFIG_HOME are defined.");
        return config_base{};
    }
    const auto config_path =
        xdg_env ? (fs::path(xdg_env.value()) / "regsync")
                : (fs::path(home_env.value()) / ".config/regsync");
    const auto config_file = config_path / "config";

    auto create_config_file = [](const auto& path) {
        auto fid = std::ofstream(path);
        fid << config_file_default << std::endl;
    };
    if (!fs::exists(config_path)) {
        spdlog::debug("load_user_config: creating configuration path {}",
                      config_path);
        std::error_code ec;
        fs::create_directories(config_path, ec);
        if (ec) {
            spdlog::error("load_user_config: unable to create config path: {}",
                          ec.message());
            return config_base{};
        }
        spdlog::debug("load_user_config: creating configuration file {}",
                      config_file);
        create_config_file(config_file);
        return config_base{};
    } else if (!fs::exists(config_file)) {
        spdlog::debug("load_user_config: creating configuration file {}",
                      config_file);
        create_config_file(config_file);
        return config_base{};
    }

    spdlog::debug("load_user_config: opening {}", config_file);
    auto result = impl::read_config_file(config_file, calling_env);

    if (!result) {
        return util::unexpected{fmt::format(
            "error reading '{}': {}", config_file.string(), result.error())};
    }

    spdlog::info("load_user_config: loaded {}", config_file);

    return *result;
}

util::expected<config_base, std::string>
load_system_config(const envvars::state& calling_env) {
    namespace fs = std::filesystem;

    const auto config_path = fs::path(calling_env.get("REGSYNC_SYSTEM_CONFIG")
                                          .value_or("/etc/regsync/config"));
    spdlog::trace("load_system_config: using {}", config_path.string());

    if (!fs::exists(config_path)) {
        spdlog::info("load_system_config: {} does not exist", config_path);
        return config_base{};
    }

    auto result = impl::read_config_file(config_path, calling_env);
    if (!result) {
        return util::unexpected{fmt::format(
            "error reading '{}': {}", config_path.string(), result.error())};
    }

    spdlog::info("load_system_config: loaded {}", config_path);
    return result;
}

util::expected<config_base, std::string>
load_config(const config_base& cli_config, const envvars::state& calling_env) {
    auto config = default_config(calling_env);
    auto sys = load_system_config(calling_env);
    if (!sys) {
        return util::unexpected(sys.error());
    }
    config = merge(*sys, config);
    auto usr = load_user_config(calling_env);
    if (!usr) {
        return util::unexpected(usr.error());
    }
    config = merge(*usr, config);
    return merge(cli_config, config);
}

namespace impl {

util::expected<bool, std::string> parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    return util::unexpected{"must be true or false"};
}

util::expected<int, std::string> parse_non_negative_int(const std::string& s) {
    if (util::strip(s) == "0") {
        return 0;
    }
    return parse_positive_int(s);
}

util::expected<config_base, std::string>
read_config_file(const std::filesystem::path& path,
                 const envvars::state& calling_env) {
    namespace fs = std::filesystem;

    if (!fs::exists(path) || !std::filesystem::is_regular_file(path)) {
        return util::unexpected{"file does not exist or is not a regular file"};
    }

    // open the configuration file
    std::ifstream fid(path);
    if (!fid.is_open()) {
        return util::unexpected{"unable to open file"};
    }

    // parse the file line by line, recording the line of each key
    struct entry {
        std::string value;
        unsigned lineno;
    };
    std::string line;
    std::map<std::string, entry> settings;
    unsigned lineno = 1;
    while (std::getline(fid, line)) {
        if (const auto result = parse_config_line(line)) {
            if (*result) {
                if (settings.contains(result->key)) {
                    spdlog::warn(
                        "the configuration parameter {} is defined more than "
                        "once (line {})",
                        result->key, lineno);
                }
                settings[result->key] = {
                    calling_env.expand(result->value), lineno};
            }
        } else {
            return util::unexpected{
                fmt::format("line {}: {}\n  {}", lineno, line, result.error())};
        }
        ++lineno;
    }

    fid.close();

    // build a config from the key value
    config_base config;
    for (auto& [key, e] : settings) {
        const auto& value = e.value;
        auto invalid = [&key, &e](const std::string& msg) {
            return util::unexpected(
                fmt::format("line {}: invalid configuration value '{} = {}': {}",
                            e.lineno, key, e.value, msg));
        };
        auto int_value = [&](auto parser) -> util::expected<int, std::string> {
            auto v = parser(value);
            if (!v) {
                return invalid(v.error());
            }
            return *v;
        };

        if (key == "color" || key == "scan-on-push") {
            auto v = parse_bool(value);
            if (!v) {
                return invalid(v.error());
            }
            (key == "color" ? config.color : config.scan_on_push) = *v;
        } else if (key == "jobs") {
            auto v = int_value(parse_positive_int);
            if (!v) {
                return util::unexpected(v.error());
            }
            config.jobs = *v;
        } else if (key == "days") {
            auto v = int_value(parse_positive_int);
            if (!v) {
                return util::unexpected(v.error());
            }
            config.days = *v;
        } else if (key == "api-timeout") {
            auto v = int_value(parse_positive_int);
            if (!v) {
                return util::unexpected(v.error());
            }
            config.api_timeout = *v;
        } else if (key == "transfer-timeout") {
            auto v = int_value(parse_positive_int);
            if (!v) {
                return util::unexpected(v.error());
            }
            config.transfer_timeout = *v;
        } else if (key == "retry-attempts") {
            auto v = int_value(parse_positive_int);
            if (!v) {
                return util::unexpected(v.error());
            }
            if (*v > max_retry_attempts) {
                return invalid(fmt::format("at most {} attempts are allowed",
                                           max_retry_attempts));
            }
            config.retry_attempts = *v;
        } else if (key == "retry-backoff-ms") {
            auto v = int_value(parse_non_negative_int);
            if (!v) {
                return util::unexpected(v.error());
            }
            config.retry_backoff_ms = *v;
        } else if (key == "scan-fail-severity") {
            if (auto v = parse_severity_threshold(value); !v) {
                return invalid(v.error());
            }
            config.scan_fail_severity = value;
        } else if (key == "aws" || key == "docker") {
            if (value.empty()) {
                return invalid("an executable name or path is required");
            }
            (key == "aws" ? config.aws : config.docker) = value;
        } else {
            return util::unexpected(
                fmt::format("line {}: invalid configuration parameter '{}'",
                            e.lineno, key));
        }
    }

    return config;
}

} // namespace impl

} // namespace regsync
