#include <algorithm>
#include <cctype>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

#include "strings.h"

namespace util {

std::string strip(std::string_view input) {
    auto is_space = [](char c) -> bool {
        return std::isspace(static_cast<unsigned char>(c));
    };
    auto b = std::find_if_not(input.begin(), input.end(), is_space);
    if (b == input.end()) {
        return {};
    }
    auto e = input.end();
    while (is_space(*--e))
        ;
    return {b, e + 1};
}

std::vector<std::string> split(std::string_view s, const char delim,
                               const bool drop_empty) {
    std::vector<std::string> results;

    auto pos = s.cbegin();
    auto end = s.cend();
    auto next = std::find(pos, end, delim);
    while (next != end) {
        if (!drop_empty || pos != next) {
            results.emplace_back(pos, next);
        }
        pos = next + 1;
        next = std::find(pos, end, delim);
    }
    if (!drop_empty || pos != next) {
        results.emplace_back(pos, next);
    }
    return results;
}

std::string join(std::string_view joiner,
                 const std::vector<std::string>& list) {
    if (list.empty()) {
        return "";
    }
    if (list.size() == 1) {
        return list[0];
    }

    bool first = true;
    std::string result;
    result.reserve(std::accumulate(
        list.begin(), list.end(), (list.size() + 1) * joiner.size(),
        [](std::size_t sum, const std::string& s) { return sum + s.size(); }));

    for (auto& s : list) {
        if (!first) {
            result += joiner;
        }
        result += s;
        first = false;
    }

    return result;
}

std::string to_lower(std::string_view input) {
    std::string result(input);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

bool contains(std::string_view s, std::string_view what) {
    return s.find(what) != std::string_view::npos;
}

} // namespace util
