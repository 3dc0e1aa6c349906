#include <chrono>
#include <optional>
#include <set>
#include <string>

#include <catch2/catch_all.hpp>

#include <regsync/parse.h>

using namespace std::chrono;

namespace {
regsync::timestamp utc(int Y, unsigned M, unsigned D, int h, int m, int s) {
    return regsync::timestamp{
        sys_days{year{Y} / month{M} / day{D}} + hours{h} + minutes{m} +
        seconds{s}};
}
} // namespace

TEST_CASE("iso 8601 timestamps", "[parse]") {
    const auto expected = utc(2024, 3, 1, 12, 30, 5);

    REQUIRE(regsync::parse_timestamp("2024-03-01T12:30:05Z").value() ==
            expected);
    REQUIRE(regsync::parse_timestamp("2024-03-01T12:30:05z").value() ==
            expected);
    REQUIRE(regsync::parse_timestamp("  2024-03-01T12:30:05Z\n").value() ==
            expected);
    REQUIRE(regsync::parse_timestamp("2024-03-01 12:30:05").value() ==
            expected);
    // offsets are converted to UTC
    REQUIRE(regsync::parse_timestamp("2024-03-01T13:30:05+01:00").value() ==
            expected);
    REQUIRE(regsync::parse_timestamp("2024-03-01T07:00:05-05:30").value() ==
            expected);
    REQUIRE(regsync::parse_timestamp("2024-03-01T13:30:05+0100").value() ==
            expected);
    // the offset can move the time to another day
    REQUIRE(regsync::parse_timestamp("2024-02-29T23:30:05-13:00").value() ==
            expected);

    // fractional seconds
    auto frac = regsync::parse_timestamp("2024-03-01T12:30:05.250+00:00");
    REQUIRE(frac);
    REQUIRE(*frac - expected == milliseconds(250));
    frac = regsync::parse_timestamp("2024-03-01T12:30:05.123456789123Z");
    REQUIRE(frac);
    REQUIRE(duration_cast<nanoseconds>(*frac - expected) ==
            nanoseconds(123456789));
}

TEST_CASE("epoch timestamps", "[parse]") {
    const auto expected = utc(2024, 3, 1, 12, 30, 5);

    REQUIRE(regsync::parse_timestamp("1709296205").value() == expected);
    REQUIRE(regsync::parse_timestamp("0").value() == regsync::timestamp{});

    auto frac = regsync::parse_timestamp("1709296205.5");
    REQUIRE(frac);
    REQUIRE(*frac - expected == milliseconds(500));
}

TEST_CASE("invalid timestamps", "[parse]") {
    for (auto in : {"", "   ", "wombat", "2024-03-01", "2024-03-01T12:30",
                    "2024-13-01T12:30:05Z", "2024-02-30T12:30:05Z",
                    "2024-03-01T25:30:05Z", "2024-03-01T12:30:05Q",
                    "2024-03-01T12:30:05+1", "1709296205.5s", "12abc"}) {
        INFO(in);
        REQUIRE(!regsync::parse_timestamp(in));
    }
}

TEST_CASE("severity", "[parse]") {
    using enum regsync::severity;
    REQUIRE(regsync::parse_severity("informational").value() == informational);
    REQUIRE(regsync::parse_severity("LOW").value() == low);
    REQUIRE(regsync::parse_severity("Medium").value() == medium);
    REQUIRE(regsync::parse_severity(" high ").value() == high);
    REQUIRE(regsync::parse_severity("CRITICAL").value() == critical);
    REQUIRE(regsync::parse_severity("UNDEFINED").value() == undefined);
    REQUIRE(!regsync::parse_severity("none"));
    REQUIRE(!regsync::parse_severity("severe"));
    REQUIRE(!regsync::parse_severity(""));

    // severities are ordered
    REQUIRE(informational < low);
    REQUIRE(low < medium);
    REQUIRE(medium < high);
    REQUIRE(high < critical);

    REQUIRE(regsync::parse_severity_threshold("none").value() == std::nullopt);
    REQUIRE(regsync::parse_severity_threshold("NONE").value() == std::nullopt);
    REQUIRE(regsync::parse_severity_threshold("high").value() == high);
    REQUIRE(!regsync::parse_severity_threshold("wombat"));
}

TEST_CASE("name lists", "[parse]") {
    using names = std::set<std::string>;
    REQUIRE(regsync::parse_name_list("") == names{});
    REQUIRE(regsync::parse_name_list(",, ,") == names{});
    REQUIRE(regsync::parse_name_list("app") == names{"app"});
    REQUIRE(regsync::parse_name_list("app,worker") == names{"app", "worker"});
    REQUIRE(regsync::parse_name_list(" app , team/worker,,app ") ==
            names{"app", "team/worker"});
}

TEST_CASE("profiles and regions", "[parse]") {
    for (auto p : {"default", "prod", "Build_2", "ci-deploy", "a", "0"}) {
        INFO(p);
        REQUIRE(regsync::valid_profile(p));
    }
    for (auto p : {"", "prod account", "prod;rm", "a.b", "$HOME", "a/b"}) {
        INFO(p);
        REQUIRE(!regsync::valid_profile(p));
    }
    for (auto r : {"us-east-1", "eu-central-2", "cn-north-1"}) {
        INFO(r);
        REQUIRE(regsync::valid_region(r));
    }
    for (auto r : {"", "US-EAST-1", "us_east_1", "us east", "us-east-1;"}) {
        INFO(r);
        REQUIRE(!regsync::valid_region(r));
    }
}

TEST_CASE("config lines", "[parse]") {
    for (auto in : {"", "   ", "# comment", "  # indented = comment"}) {
        auto r = regsync::parse_config_line(in);
        REQUIRE(r);
        REQUIRE(!*r);
    }
    {
        auto r = regsync::parse_config_line("jobs = 4");
        REQUIRE(r);
        REQUIRE(*r);
        REQUIRE(r->key == "jobs");
        REQUIRE(r->value == "4");
    }
    {
        auto r = regsync::parse_config_line("  retry-backoff-ms=250 ");
        REQUIRE(r);
        REQUIRE(r->key == "retry-backoff-ms");
        REQUIRE(r->value == "250");
    }
    {
        // only the first '=' separates key and value
        auto r = regsync::parse_config_line("docker = /opt/a=b/docker");
        REQUIRE(r);
        REQUIRE(r->value == "/opt/a=b/docker");
    }
    {
        auto r = regsync::parse_config_line("aws =");
        REQUIRE(r);
        REQUIRE(r->key == "aws");
        REQUIRE(r->value.empty());
    }
    REQUIRE(!regsync::parse_config_line("jobs"));
    REQUIRE(!regsync::parse_config_line("= 4"));
    REQUIRE(!regsync::parse_config_line("number of jobs = 4"));
}

TEST_CASE("positive integers", "[parse]") {
    REQUIRE(regsync::parse_positive_int("1").value() == 1);
    REQUIRE(regsync::parse_positive_int(" 30 ").value() == 30);
    REQUIRE(!regsync::parse_positive_int("0"));
    REQUIRE(!regsync::parse_positive_int("-3"));
    REQUIRE(!regsync::parse_positive_int("3.5"));
    REQUIRE(!regsync::parse_positive_int("ten"));
    REQUIRE(!regsync::parse_positive_int(""));
}
