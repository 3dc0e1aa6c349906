#include <chrono>
#include <filesystem>
#include <fstream>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>

#include <regsync/settings.h>
#include <util/envvars.h>
#include <util/fs.h>

namespace matchers = Catch::Matchers;
using namespace std::chrono_literals;

TEST_CASE("read config files", "[settings]") {
    auto exe = util::exe_path();
    if (!exe) {
        SKIP("unable to find path of unit executable");
    }
    auto config_root = exe->parent_path() / "data/config-files";

    {
        auto result = regsync::impl::read_config_file(config_root / "empty", {});
        REQUIRE(result);
        REQUIRE(!result->color);
        REQUIRE(!result->jobs);
        REQUIRE(!result->aws);
    }
    {
        auto result = regsync::impl::read_config_file(config_root / "all", {});
        REQUIRE(result);
        REQUIRE(result->color == false);
        REQUIRE(result->jobs == 4);
        REQUIRE(result->days == 7);
        REQUIRE(result->api_timeout == 60);
        REQUIRE(result->transfer_timeout == 1800);
        REQUIRE(result->retry_attempts == 1);
        REQUIRE(result->retry_backoff_ms == 500);
        REQUIRE(result->scan_fail_severity == "high");
        REQUIRE(result->scan_on_push == false);
        REQUIRE(result->aws == "/opt/aws/bin/aws");
        REQUIRE(result->docker == "/usr/local/bin/docker");
    }
    {
        auto result =
            regsync::impl::read_config_file(config_root / "comments", {});
        REQUIRE(result);
        REQUIRE(result->jobs == 2);
        REQUIRE(!result->days);
    }
    {
        envvars::state env{};
        env.set("TOOLS", "/users/wombat/tools");
        auto result =
            regsync::impl::read_config_file(config_root / "envvar", env);
        REQUIRE(result);
        REQUIRE(result->docker == "/users/wombat/tools/docker");
        // unset variables expand to an empty string
        REQUIRE(result->aws == "/aws");
    }
    {
        auto result =
            regsync::impl::read_config_file(config_root / "zero-backoff", {});
        REQUIRE(result);
        REQUIRE(result->retry_backoff_ms == 0);
        REQUIRE(result->scan_fail_severity == "none");
    }
    // errors name the line where they were found
    {
        auto result =
            regsync::impl::read_config_file(config_root / "invalid-key", {});
        REQUIRE(!result);
        REQUIRE_THAT(result.error(), matchers::ContainsSubstring("line 2"));
        REQUIRE_THAT(result.error(), matchers::ContainsSubstring("repo"));
    }
    {
        auto result =
            regsync::impl::read_config_file(config_root / "invalid-jobs", {});
        REQUIRE(!result);
        REQUIRE_THAT(result.error(), matchers::ContainsSubstring("line 2"));
    }
    {
        auto result =
            regsync::impl::read_config_file(config_root / "invalid-retry", {});
        REQUIRE(!result);
        REQUIRE_THAT(result.error(), matchers::ContainsSubstring("line 2"));
        REQUIRE_THAT(result.error(), matchers::ContainsSubstring("at most 2"));
    }
    {
        auto result =
            regsync::impl::read_config_file(config_root / "invalid-line", {});
        REQUIRE(!result);
        REQUIRE_THAT(result.error(), matchers::ContainsSubstring("line 2"));
    }
    for (auto name : {"invalid-color", "invalid-severity"}) {
        INFO(name);
        auto result = regsync::impl::read_config_file(config_root / name, {});
        REQUIRE(!result);
        REQUIRE_THAT(result.error(), matchers::ContainsSubstring("line 1"));
    }
    {
        auto result =
            regsync::impl::read_config_file(config_root / "does-not-exist", {});
        REQUIRE(!result);
    }
}

TEST_CASE("merge config", "[settings]") {
    regsync::config_base lhs{.jobs = 4, .aws = "/opt/aws"};
    regsync::config_base rhs{.jobs = 1, .days = 30, .docker = "docker"};

    auto m = regsync::merge(lhs, rhs);
    REQUIRE(m.jobs == 4);
    REQUIRE(m.days == 30);
    REQUIRE(m.aws == "/opt/aws");
    REQUIRE(m.docker == "docker");
    REQUIRE(!m.color);
}

TEST_CASE("load config", "[settings]") {
    namespace fs = std::filesystem;

    const auto root = util::make_temp_dir();
    const auto system_config = root / "system-config";
    {
        std::ofstream fid(system_config);
        fid << "jobs = 3\ndays = 14\n";
    }

    envvars::state env{};
    env.set("REGSYNC_SYSTEM_CONFIG", system_config.string());
    env.set("XDG_CONFIG_HOME", (root / "xdg").string());

    // the user config file is created from a template the first time
    {
        auto config = regsync::load_config({}, env);
        REQUIRE(config);
        REQUIRE(fs::is_regular_file(root / "xdg/regsync/config"));
        REQUIRE(config->jobs == 3);
        REQUIRE(config->days == 14);
        // defaults
        REQUIRE(config->retry_attempts == 2);
        REQUIRE(config->aws == "aws");
    }
    // the template only contains comments
    {
        auto result =
            regsync::impl::read_config_file(root / "xdg/regsync/config", env);
        REQUIRE(result);
        REQUIRE(!result->jobs);
    }
    // the user config takes precedence over the system config, and the
    // command line over both
    {
        std::ofstream fid(root / "xdg/regsync/config");
        fid << "jobs = 5\n";
    }
    {
        auto config = regsync::load_config({}, env);
        REQUIRE(config);
        REQUIRE(config->jobs == 5);
        REQUIRE(config->days == 14);

        config = regsync::load_config({.jobs = 8}, env);
        REQUIRE(config);
        REQUIRE(config->jobs == 8);
    }
    // a config file with an error is reported
    {
        std::ofstream fid(root / "xdg/regsync/config");
        fid << "jobs = many\n";
    }
    REQUIRE(!regsync::load_config({}, env));
}

TEST_CASE("generate configuration", "[settings]") {
    envvars::state env{};
    env.set("PATH", "/bin:/usr/bin");

    regsync::config_base base{
        .color = true,
        .jobs = 2,
        .days = 10,
        .api_timeout = 30,
        .transfer_timeout = 600,
        .retry_attempts = 1,
        .retry_backoff_ms = 100,
        .scan_fail_severity = "none",
        .scan_on_push = false,
        // any executable that is sure to exist
        .aws = "ls",
        .docker = "/wombat/soup/docker",
    };
    auto config = regsync::generate_configuration(base, env);
    REQUIRE(config);
    REQUIRE(config->color);
    REQUIRE(config->jobs == 2);
    REQUIRE(config->days == 10);
    REQUIRE(config->api_timeout == 30s);
    REQUIRE(config->transfer_timeout == 600s);
    REQUIRE(config->retry.max_attempts == 1u);
    REQUIRE(config->retry.backoff == 100ms);
    REQUIRE(!config->scan_fail_severity);
    REQUIRE(!config->scan_on_push);
    REQUIRE(config->aws);
    REQUIRE(config->aws->filename() == "ls");
    // executables that can't be found are not an error until they are needed
    REQUIRE(!config->docker);

    base.scan_fail_severity = "severe";
    auto bad = regsync::generate_configuration(base, env);
    REQUIRE(!bad);
    REQUIRE(bad.error().kind == regsync::error_kind::config);

    base.scan_fail_severity = "none";
    base.retry_attempts = 3;
    bad = regsync::generate_configuration(base, env);
    REQUIRE(!bad);
    REQUIRE(bad.error().kind == regsync::error_kind::config);
}

namespace {
regsync::configuration test_configuration() {
    regsync::configuration config;
    config.aws = "/usr/bin/aws";
    config.docker = "/usr/bin/docker";
    return config;
}

regsync::sync_request test_request() {
    return {.source_profile = "build",
            .source_region = "us-east-1",
            .destination_profile = "deploy",
            .destination_region = "eu-west-1"};
}
} // namespace

TEST_CASE("make_sync_config", "[settings]") {
    const auto config = test_configuration();

    SECTION("defaults") {
        auto c = regsync::make_sync_config(test_request(), config);
        REQUIRE(c);
        REQUIRE(c->source == regsync::account{"build", "us-east-1"});
        REQUIRE(c->destination == regsync::account{"deploy", "eu-west-1"});
        REQUIRE(c->policy.max_age_days == 30);
        REQUIRE(c->policy.filter.kind == regsync::name_filter::none);
        REQUIRE(!c->policy.require_scan);
        REQUIRE(!c->policy.include_untagged);
        REQUIRE(c->policy.scan_fail_severity == regsync::severity::critical);
        REQUIRE(c->jobs == 1u);
        REQUIRE(c->retry.max_attempts == 2u);
        REQUIRE(c->api_timeout == 120s);
        REQUIRE(c->transfer_timeout == 3600s);
        REQUIRE(!c->dry_run);
    }

    SECTION("command line arguments") {
        auto r = test_request();
        r.days = 7;
        r.include_repos = "app, worker";
        r.require_scan = true;
        r.scan_fail_severity = "high";
        r.ignore_tags = true;
        r.jobs = 4;
        auto c = regsync::make_sync_config(r, config);
        REQUIRE(c);
        REQUIRE(c->policy.max_age_days == 7);
        REQUIRE(c->policy.filter.kind == regsync::name_filter::allow);
        REQUIRE(c->policy.filter.names ==
                std::set<std::string>{"app", "worker"});
        REQUIRE(c->policy.require_scan);
        REQUIRE(c->policy.include_untagged);
        REQUIRE(c->policy.scan_fail_severity == regsync::severity::high);
        REQUIRE(c->jobs == 4u);

        r.include_repos = std::nullopt;
        r.exclude_repos = "legacy";
        r.scan_fail_severity = "none";
        c = regsync::make_sync_config(r, config);
        REQUIRE(c);
        REQUIRE(c->policy.filter.kind == regsync::name_filter::deny);
        REQUIRE(!c->policy.scan_fail_severity);
    }

    SECTION("include and exclude lists are exclusive") {
        auto r = test_request();
        r.include_repos = "app";
        r.exclude_repos = "worker";
        auto c = regsync::make_sync_config(r, config);
        REQUIRE(!c);
        REQUIRE(c.error().kind == regsync::error_kind::config);
    }

    SECTION("invalid arguments") {
        auto check = [&config](regsync::sync_request r) {
            auto c = regsync::make_sync_config(r, config);
            REQUIRE(!c);
            REQUIRE(c.error().kind == regsync::error_kind::config);
        };
        auto r = test_request();
        r.days = 0;
        check(r);

        r = test_request();
        r.jobs = 0;
        check(r);

        r = test_request();
        r.source_profile = "build; rm -rf /";
        check(r);

        r = test_request();
        r.destination_region = "EU-WEST-1";
        check(r);

        r = test_request();
        r.scan_fail_severity = "severe";
        check(r);

        r = test_request();
        r.include_repos = " , ";
        check(r);

        // one retry at most
        auto retry_config = config;
        retry_config.retry.max_attempts = 3;
        REQUIRE(!regsync::make_sync_config(test_request(), retry_config));

        // the source and destination must be different accounts
        r = test_request();
        r.destination_profile = r.source_profile;
        r.destination_region = r.source_region;
        check(r);
    }

    SECTION("executables") {
        auto no_docker = config;
        no_docker.docker = std::nullopt;
        REQUIRE(!regsync::make_sync_config(test_request(), no_docker));

        // docker is not required to print the plan
        auto r = test_request();
        r.dry_run = true;
        auto c = regsync::make_sync_config(r, no_docker);
        REQUIRE(c);
        REQUIRE(c->dry_run);

        auto no_aws = config;
        no_aws.aws = std::nullopt;
        REQUIRE(!regsync::make_sync_config(r, no_aws));
    }

    SECTION("configuration defaults are overridden by arguments") {
        auto cfg = config;
        cfg.days = 5;
        cfg.jobs = 3;
        cfg.scan_fail_severity = regsync::severity::medium;
        auto c = regsync::make_sync_config(test_request(), cfg);
        REQUIRE(c);
        REQUIRE(c->policy.max_age_days == 5);
        REQUIRE(c->jobs == 3u);
        REQUIRE(c->policy.scan_fail_severity == regsync::severity::medium);

        auto r = test_request();
        r.days = 9;
        r.jobs = 1;
        c = regsync::make_sync_config(r, cfg);
        REQUIRE(c);
        REQUIRE(c->policy.max_age_days == 9);
        REQUIRE(c->jobs == 1u);
    }
}
