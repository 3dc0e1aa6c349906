#include <cctype>
#include <charconv>
#include <chrono>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <regsync/parse.h>
#include <util/expected.h>
#include <util/strings.h>

namespace regsync {

namespace impl {

// a minimal cursor over the input, used to parse time stamps
struct scanner {
    std::string_view input;
    std::size_t pos = 0;

    bool done() const {
        return pos >= input.size();
    }
    char peek() const {
        return done() ? 0 : input[pos];
    }
    bool consume(char c) {
        if (peek() == c) {
            ++pos;
            return true;
        }
        return false;
    }
    bool is_digit() const {
        return peek() >= '0' && peek() <= '9';
    }

    // read exactly n digits
    std::optional<int> digits(unsigned n) {
        if (pos + n > input.size()) {
            return std::nullopt;
        }
        int value = 0;
        auto [ptr, ec] = std::from_chars(input.data() + pos,
                                         input.data() + pos + n, value);
        if (ec != std::errc() || ptr != input.data() + pos + n) {
            return std::nullopt;
        }
        pos += n;
        return value;
    }

    // read a fraction of a second following a '.', with at most nanosecond
    // precision: further digits are ignored.
    std::chrono::nanoseconds fraction() {
        std::int64_t ns = 0;
        unsigned count = 0;
        while (is_digit()) {
            if (count < 9) {
                ns = ns * 10 + (peek() - '0');
                ++count;
            }
            ++pos;
        }
        for (; count < 9; ++count) {
            ns *= 10;
        }
        return std::chrono::nanoseconds{ns};
    }
};

util::expected<timestamp, std::string> parse_epoch(std::string_view in) {
    using namespace std::chrono;

    scanner S{in};
    std::int64_t secs = 0;
    auto [ptr, ec] = std::from_chars(in.data(), in.data() + in.size(), secs);
    if (ec != std::errc()) {
        return util::unexpected(fmt::format("invalid time stamp '{}'", in));
    }
    S.pos = ptr - in.data();

    nanoseconds frac{0};
    if (S.consume('.')) {
        frac = S.fraction();
    }
    if (!S.done()) {
        return util::unexpected(fmt::format("invalid time stamp '{}'", in));
    }

    return timestamp{duration_cast<system_clock::duration>(secs * 1s + frac)};
}

util::expected<timestamp, std::string> parse_iso8601(std::string_view in) {
    using namespace std::chrono;

    auto fail = [in](std::string_view what) {
        return util::unexpected(
            fmt::format("invalid time stamp '{}': {}", in, what));
    };

    scanner S{in};
    auto Y = S.digits(4);
    if (!Y || !S.consume('-')) {
        return fail("expected a year YYYY-");
    }
    auto M = S.digits(2);
    if (!M || !S.consume('-')) {
        return fail("expected a month MM-");
    }
    auto D = S.digits(2);
    if (!D) {
        return fail("expected a day DD");
    }
    const year_month_day date{year{*Y}, month{static_cast<unsigned>(*M)},
                              day{static_cast<unsigned>(*D)}};
    if (!date.ok()) {
        return fail("invalid date");
    }

    if (!(S.consume('T') || S.consume('t') || S.consume(' '))) {
        return fail("expected 'T' separating date and time");
    }

    auto h = S.digits(2);
    if (!h || !S.consume(':')) {
        return fail("expected hours HH:");
    }
    auto m = S.digits(2);
    if (!m || !S.consume(':')) {
        return fail("expected minutes MM:");
    }
    auto s = S.digits(2);
    if (!s) {
        return fail("expected seconds SS");
    }
    if (*h > 23 || *m > 59 || *s > 60) {
        return fail("invalid time");
    }

    nanoseconds frac{0};
    if (S.consume('.')) {
        frac = S.fraction();
    }

    // time zone: Z, +HH:MM, -HH:MM, +HHMM or -HHMM
    minutes offset{0};
    if (S.peek() == 'Z' || S.peek() == 'z') {
        S.consume(S.peek());
    } else if (S.peek() == '+' || S.peek() == '-') {
        const int sign = S.peek() == '-' ? -1 : 1;
        S.consume(S.peek());
        auto oh = S.digits(2);
        S.consume(':');
        auto om = S.digits(2);
        if (!oh || !om) {
            return fail("invalid time zone offset");
        }
        offset = sign * (hours{*oh} + minutes{*om});
    }
    if (!S.done()) {
        return fail("unexpected characters at end of input");
    }

    auto tp = sys_days{date} + hours{*h} + minutes{*m} + seconds{*s} + frac -
              offset;
    return timestamp{duration_cast<system_clock::duration>(
        tp.time_since_epoch())};
}

} // namespace impl

util::expected<timestamp, std::string> parse_timestamp(const std::string& in) {
    const auto input = util::strip(in);
    spdlog::trace("parsing time stamp '{}'", input);
    if (input.empty()) {
        return util::unexpected("empty time stamp");
    }
    // an ISO 8601 date starts with a 4 digit year followed by '-'
    if (input.size() > 4 && input[4] == '-') {
        return impl::parse_iso8601(input);
    }
    return impl::parse_epoch(input);
}

util::expected<severity, std::string> parse_severity(const std::string& in) {
    using enum severity;
    const auto s = util::to_lower(util::strip(in));
    if (s == "informational") {
        return informational;
    }
    if (s == "low") {
        return low;
    }
    if (s == "medium") {
        return medium;
    }
    if (s == "high") {
        return high;
    }
    if (s == "critical") {
        return critical;
    }
    if (s == "undefined") {
        return undefined;
    }
    return util::unexpected(fmt::format(
        "invalid severity '{}': expected one of informational, low, medium, "
        "high or critical",
        in));
}

util::expected<std::optional<severity>, std::string>
parse_severity_threshold(const std::string& in) {
    if (util::to_lower(util::strip(in)) == "none") {
        return std::optional<severity>{};
    }
    auto s = parse_severity(in);
    if (!s) {
        return util::unexpected(s.error() + " or none");
    }
    return std::optional<severity>{*s};
}

std::set<std::string> parse_name_list(const std::string& in) {
    std::set<std::string> names;
    for (auto& name : util::split(in, ',', true)) {
        if (auto n = util::strip(name); !n.empty()) {
            names.insert(std::move(n));
        }
    }
    return names;
}

bool valid_profile(const std::string& in) {
    static const std::regex pattern("^[a-z0-9_-]+$", std::regex::icase);
    return std::regex_match(in, pattern);
}

bool valid_region(const std::string& in) {
    static const std::regex pattern("^[a-z0-9-]+$");
    return std::regex_match(in, pattern);
}

util::expected<config_line, std::string>
parse_config_line(const std::string& arg) {
    const auto line = util::strip(arg);
    spdlog::trace("parsing config line '{}'", arg);

    // empty lines or lines that start with '#' are skipped
    if (line.empty() || line[0] == '#') {
        return config_line{};
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
        return util::unexpected(
            fmt::format("expected 'key = value', found '{}'", line));
    }

    config_line result{util::strip(line.substr(0, eq)),
                       util::strip(line.substr(eq + 1))};
    if (result.key.empty()) {
        return util::unexpected(fmt::format("missing key in '{}'", line));
    }
    for (char c : result.key) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-' ||
              c == '_')) {
            return util::unexpected(
                fmt::format("invalid character '{}' in key '{}'", c,
                            result.key));
        }
    }

    return result;
}

util::expected<int, std::string> parse_positive_int(const std::string& in) {
    const auto s = util::strip(in);
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return util::unexpected(fmt::format("'{}' is not an integer", in));
    }
    if (value < 1) {
        return util::unexpected(
            fmt::format("'{}' must be greater than zero", in));
    }
    return value;
}

} // namespace regsync
