#include <chrono>
#include <set>
#include <string>

#include <catch2/catch_all.hpp>

#include <regsync/inventory.h>
#include <regsync/registry.h>

#include "mocks.h"

using namespace std::chrono_literals;

TEST_CASE("pagination", "[inventory]") {
    const auto now = std::chrono::system_clock::now();
    mock::registry src({"build", "us-east-1"});
    src.state().page_size = 2;
    for (auto repo : {"a", "b", "c", "d", "e"}) {
        src.add_repository(repo);
    }
    for (int i = 0; i < 5; ++i) {
        src.add(mock::image("c", fmt::format("sha256:{:04}", i),
                            {fmt::format("v{}", i)}, now));
    }

    auto inv = regsync::fetch_inventory(src);
    REQUIRE(inv);
    REQUIRE(inv->owner == regsync::account{"build", "us-east-1"});
    REQUIRE(inv->repositories ==
            std::set<std::string>{"a", "b", "c", "d", "e"});
    REQUIRE(inv->images.size() == 5u);
    REQUIRE(inv->denied.empty());
    // 3 pages of repositories
    REQUIRE(src.state().list_repositories_calls == 3u);
    // one page for each empty repository, 3 pages for c
    REQUIRE(src.state().list_images_calls == 7u);

    // empty repositories are recorded
    auto digests = inv->digests();
    REQUIRE(digests.size() == 5u);
    REQUIRE(digests["a"].empty());
    REQUIRE(digests["c"].size() == 5u);
}

TEST_CASE("entries with the same digest are merged", "[inventory]") {
    const auto now = std::chrono::system_clock::now();
    mock::registry src({"build", "us-east-1"});
    src.state().page_size = 1;
    src.add(mock::image("app", "sha256:aa", {"v1"}, now - 2h));
    src.add(mock::image("app", "sha256:bb", {"v2"}, now - 1h));
    src.add(mock::image("app", "sha256:aa", {"latest"}, now));
    // the same digest in another repository is a different image
    src.add(mock::image("other", "sha256:aa", {"v1"}, now));

    auto inv = regsync::fetch_inventory(src);
    REQUIRE(inv);
    REQUIRE(inv->images.size() == 3u);

    const auto& aa = inv->images[0];
    REQUIRE(aa.repository == "app");
    REQUIRE(aa.digest == "sha256:aa");
    REQUIRE(aa.tags == std::set<std::string>{"latest", "v1"});
    REQUIRE(aa.pushed_at == now);

    REQUIRE(inv->images[1].digest == "sha256:bb");
    REQUIRE(inv->images[2].repository == "other");
}

TEST_CASE("repository errors", "[inventory]") {
    using enum regsync::error_kind;
    const auto now = std::chrono::system_clock::now();
    mock::registry src({"build", "us-east-1"});
    src.add(mock::image("app", "sha256:aa", {"v1"}, now));
    src.add(mock::image("secret", "sha256:bb", {"v1"}, now));
    src.add(mock::image("vanished", "sha256:cc", {"v1"}, now));

    SECTION("permission denied") {
        src.state().list_images_errors["secret"] =
            mock::make_error(permission_denied);
        auto inv = regsync::fetch_inventory(src);
        REQUIRE(inv);
        REQUIRE(inv->denied == std::set<std::string>{"secret"});
        REQUIRE(inv->images.size() == 2u);
        // the repository is still listed
        REQUIRE(inv->repositories.contains("secret"));
    }
    SECTION("repository deleted while listing") {
        src.state().list_images_errors["vanished"] =
            mock::make_error(not_found);
        auto inv = regsync::fetch_inventory(src);
        REQUIRE(inv);
        REQUIRE(inv->denied.empty());
        REQUIRE(inv->images.size() == 2u);
    }
    SECTION("service errors fail the fetch") {
        src.state().list_images_errors["secret"] =
            mock::make_error(registry_unavailable);
        auto inv = regsync::fetch_inventory(src);
        REQUIRE(!inv);
        REQUIRE(inv.error().kind == registry_unavailable);
    }
    SECTION("auth errors fail the fetch") {
        src.state().list_repositories_errors.push_back(mock::make_error(auth));
        auto inv = regsync::fetch_inventory(src);
        REQUIRE(!inv);
        REQUIRE(inv.error().kind == auth);
    }
}

namespace {
// a registry that returns the same pagination token forever
struct looping_registry : mock::registry {
    using mock::registry::registry;
    util::expected<regsync::repository_page, regsync::error>
    list_repositories(const std::optional<std::string>&) const {
        return regsync::repository_page{{"app"}, "again"};
    }
};
} // namespace

TEST_CASE("repeated pagination tokens", "[inventory]") {
    looping_registry src({"build", "us-east-1"});
    auto inv = regsync::fetch_inventory(src);
    REQUIRE(!inv);
    REQUIRE(inv.error().kind == regsync::error_kind::registry_unavailable);
}
