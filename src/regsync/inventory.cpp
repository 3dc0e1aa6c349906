#include <algorithm>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include <regsync/inventory.h>

namespace regsync {

std::map<std::string, std::set<std::string>> inventory::digests() const {
    std::map<std::string, std::set<std::string>> result;
    for (auto& r : repositories) {
        result[r];
    }
    for (auto& i : images) {
        result[i.repository].insert(i.digest);
    }
    return result;
}

// request pages until there is no next token
template <typename T, typename F>
util::expected<std::vector<T>, error> fetch_all(F&& fetch) {
    std::vector<T> items;
    std::optional<std::string> token;
    std::set<std::string> seen_tokens;
    do {
        auto page = fetch(token);
        if (!page) {
            return util::unexpected(page.error());
        }
        std::move(page->items.begin(), page->items.end(),
                  std::back_inserter(items));
        token = std::move(page->next_token);
        // protect against a registry that returns the same token forever
        if (token && !seen_tokens.insert(*token).second) {
            return util::unexpected(error{
                error_kind::registry_unavailable,
                "the registry returned a repeated pagination token",
                *token});
        }
    } while (token);
    return items;
}

util::expected<inventory, error> fetch_inventory(const registry& reg) {
    inventory result{.owner = reg.owner()};
    spdlog::debug("fetch_inventory: {}", result.owner);

    auto repositories = fetch_all<std::string>([&reg](const auto& token) {
        return reg.list_repositories(token);
    });
    if (!repositories) {
        spdlog::error("fetch_inventory: unable to list repositories of {}: {}",
                      result.owner, repositories.error());
        return util::unexpected(repositories.error());
    }
    result.repositories =
        std::set<std::string>(repositories->begin(), repositories->end());
    spdlog::info("fetch_inventory: {} has {} repositories", result.owner,
                 result.repositories.size());

    // (repository, digest) -> image
    std::map<std::pair<std::string, std::string>, registry_image> images;
    for (auto& repo : result.repositories) {
        auto listing =
            fetch_all<registry_image>([&reg, &repo](const auto& token) {
                return reg.list_images(repo, token);
            });
        if (!listing) {
            switch (listing.error().kind) {
            case error_kind::permission_denied:
                spdlog::warn("fetch_inventory: permission denied listing "
                             "images of {} in {}",
                             repo, result.owner);
                result.denied.insert(repo);
                continue;
            case error_kind::not_found:
                spdlog::warn("fetch_inventory: the repository {} in {} was "
                             "deleted while it was being listed",
                             repo, result.owner);
                continue;
            default:
                spdlog::error("fetch_inventory: unable to list images of {} "
                              "in {}: {}",
                              repo, result.owner, listing.error());
                return util::unexpected(listing.error());
            }
        }
        spdlog::debug("fetch_inventory: {} has {} image entries", repo,
                      listing->size());
        for (auto& image : *listing) {
            auto key = std::make_pair(image.repository, image.digest);
            if (auto it = images.find(key); it != images.end()) {
                it->second.tags.insert(image.tags.begin(), image.tags.end());
                it->second.pushed_at =
                    std::max(it->second.pushed_at, image.pushed_at);
            } else {
                images.emplace(std::move(key), std::move(image));
            }
        }
    }

    for (auto& [key, image] : images) {
        result.images.push_back(std::move(image));
    }
    spdlog::info("fetch_inventory: {} has {} images", result.owner,
                 result.images.size());

    return result;
}

} // namespace regsync
