#include <deque>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>

#include "fs.h"
#include "strings.h"

namespace util {

struct temp_dir_wrap {
    std::filesystem::path path;
    ~temp_dir_wrap() {
        if (std::filesystem::is_directory(path)) {
            // ignore the error code - being unable to delete a temp path is not
            // the end of the world.
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
            //  warning: this might be called after spdlog is deactivated, so no
            //  logging!
        }
    }
};

// persistant storage for the temporary paths that will delete the paths on
// exit. This makes temporary paths persistent for the duration of the
// application's execution.
// Use a deque because it will not copy/move/delete its contents as it grows.
static std::deque<temp_dir_wrap> tmp_dir_cache;

std::filesystem::path make_temp_dir() {
    namespace fs = std::filesystem;
    auto tmp_template =
        fs::temp_directory_path().string() + "/regsync-XXXXXXXXXXXX";
    std::vector<char> base(tmp_template.data(),
                           tmp_template.data() + tmp_template.size() + 1);

    fs::path tmp_path = mkdtemp(base.data());

    spdlog::debug("make_temp_dir: created {}", tmp_path.string());
    tmp_dir_cache.emplace_back(tmp_path);

    return tmp_path;
}

std::optional<std::filesystem::path> exe_path() {
    std::error_code ec;
    // /proc/self/exe is a symlink to the currently executing process in
    // posix-land
    auto p = std::filesystem::read_symlink("/proc/self/exe", ec);

    if (ec) {
        return std::nullopt;
    }

    return p;
}

std::optional<std::filesystem::path> which(const std::string& name,
                                           const std::string& PATH) {
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.empty()) {
        return {};
    }

    if (name.find('/') != std::string::npos) {
        const fs::path p{name};
        if (is_executable(p)) {
            return fs::canonical(p);
        }
        return {};
    }

    for (auto& path : split(PATH, ':', true)) {
        const auto candidate = fs::path{path} / name;
        if (is_executable(candidate)) {
            return fs::canonical(candidate);
        }
    }

    return {};
}

std::optional<std::filesystem::path> find_tool(const std::string& name,
                                               const envvars::state& env) {
    namespace fs = std::filesystem;

    if (auto exe = exe_path()) {
        const auto p = exe->parent_path() / "../libexec" / name;
        std::error_code ec;
        if (fs::is_regular_file(p, ec)) {
            return fs::canonical(p);
        }
    }

    return which(name, env.get("PATH").value_or(""));
}

} // namespace util
