#pragma once

#include <optional>
#include <set>
#include <string>

#include <regsync/error.h>
#include <regsync/registry.h>
#include <regsync/types.h>
#include <util/expected.h>

namespace regsync {

// parse a time stamp as reported by the registry API:
//  - ISO 8601 date time with optional fractional seconds and either a 'Z'
//    or a numeric offset, e.g.
//      2024-03-01T12:30:05Z
//      2024-03-01T12:30:05.123456+01:00
//  - seconds since the epoch, with optional fraction, e.g.
//      1709296205.123
util::expected<timestamp, std::string> parse_timestamp(const std::string& in);

// parse a vulnerability severity name (case insensitive)
util::expected<severity, std::string> parse_severity(const std::string& in);

// parse the scan failure threshold: a severity, or "none" to disable the check
util::expected<std::optional<severity>, std::string>
parse_severity_threshold(const std::string& in);

// parse a comma separated list of repository names
// white space around names is ignored, as are empty entries.
std::set<std::string> parse_name_list(const std::string& in);

// credential profile names: [a-z0-9_-]+, case insensitive
bool valid_profile(const std::string& in);

// region names: [a-z0-9-]+
bool valid_region(const std::string& in);

// the result of parsing a line in a configuration file
struct config_line {
    std::string key;
    std::string value;
    // evaluates to false -> an empty or comment line
    operator bool() const {
        return !key.empty();
    }
};

// parse a line of the form "key = value"
// empty lines, and lines starting with '#', return an empty config_line
util::expected<config_line, std::string>
parse_config_line(const std::string& line);

// parse a positive integer, e.g. for the number of jobs or days
util::expected<int, std::string> parse_positive_int(const std::string& in);

} // namespace regsync
