#include <cctype>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <util/envvars.h>

namespace envvars {

// Environment variable names can contain any character from the portable
// character set except NUL and '='. In practice, shells and utilities stick
// to [a-zA-Z_][a-zA-Z0-9_]*
bool validate_name(std::string_view name, bool strict) {
    if (name.empty()) {
        return false;
    }

    if (!strict) {
        return name.find('=') == std::string_view::npos;
    }

    // environment variable names can't start with a digit
    if (std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }

    for (unsigned char c : name) {
        if (!(std::isalnum(c) || c == '_')) {
            return false;
        }
    }

    return true;
}

state::state(char* environ[]) {
    if (environ == nullptr) {
        return;
    }
    for (char** env = environ; *env != nullptr; ++env) {
        const std::string entry(*env);
        if (const auto pos = entry.find('='); pos != std::string::npos) {
            const auto name = entry.substr(0, pos);
            // tolerate strange names in the calling environment, which we
            // never use in substitutions.
            if (validate_name(name, false)) {
                variables_[name] = entry.substr(pos + 1);
            }
        }
    }
}

void state::set(std::string_view name, std::string_view value) {
    if (validate_name(name)) {
        variables_[std::string(name)] = value;
    } else {
        spdlog::warn("envvars::state::set skipping the invalid "
                     "environment variable name '{}'",
                     name);
    }
}

std::optional<std::string> state::get(std::string_view name) const {
    if (!validate_name(name, false)) {
        return std::nullopt;
    }
    if (auto it = variables_.find(std::string(name)); it != variables_.end()) {
        return it->second;
    }
    return std::nullopt;
}

void state::unset(std::string_view name) {
    variables_.erase(std::string(name));
}

const std::unordered_map<std::string, std::string>& state::variables() const {
    return variables_;
}

std::string state::expand(std::string_view src) const {
    std::string result;
    result.reserve(src.size());

    std::size_t pos = 0;
    while (pos < src.size()) {
        const auto start = src.find("${", pos);
        if (start == std::string_view::npos) {
            result.append(src.substr(pos));
            break;
        }
        result.append(src.substr(pos, start - pos));

        const auto end = src.find('}', start + 2);
        if (end == std::string_view::npos) {
            spdlog::error("envvars::state::expand: unexpected end of "
                          "string while looking for matching '}}': '{}'",
                          src);
            result.append(src.substr(start));
            break;
        }

        const auto name = src.substr(start + 2, end - start - 2);
        if (!validate_name(name)) {
            spdlog::warn("envvars::state::expand: skipping invalid env var "
                         "name '{}'",
                         name);
        } else if (auto value = get(name)) {
            result += *value;
        } else {
            spdlog::warn("envvars::state::expand: env. variable {} does not "
                         "exist",
                         name);
        }
        pos = end + 1;
    }

    spdlog::trace("envvars::state::expand '{}' -> '{}'", src, result);
    return result;
}

} // namespace envvars
