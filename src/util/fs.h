#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <util/envvars.h>

namespace util {

// create a uniquely named directory in the system temp path, which is deleted
// when the application exits.
std::filesystem::path make_temp_dir();

// return the path of the current executable
// returns empty if there is an error
std::optional<std::filesystem::path> exe_path();

// search for an executable:
//  - name contains a '/': name is used as a path
//  - otherwise each path in PATH (a colon separated list) is searched in turn
std::optional<std::filesystem::path> which(const std::string& name,
                                           const std::string& PATH);

// return the path of an external tool used by the application.
// looks in ../libexec relative to the executable first, then in PATH.
// returns empty if it can't be found
std::optional<std::filesystem::path> find_tool(const std::string& name,
                                               const envvars::state& env);

} // namespace util
