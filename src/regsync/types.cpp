#include <string>

#include <fmt/core.h>

#include <regsync/types.h>

namespace regsync {

std::string image_ref::string() const {
    auto result = endpoint.empty() ? repository
                                   : fmt::format("{}/{}", endpoint, repository);
    if (tag) {
        result += fmt::format(":{}", *tag);
    }
    if (digest) {
        result += fmt::format("@{}", *digest);
    }
    return result;
}

std::string short_digest(const std::string& digest, std::size_t n) {
    std::string_view hex = digest;
    if (auto pos = hex.find(':'); pos != std::string_view::npos) {
        hex = hex.substr(pos + 1);
    }
    return std::string(hex.substr(0, n));
}

std::string untagged_tag(const std::string& digest) {
    return "untagged-" + short_digest(digest, 12);
}

} // namespace regsync
