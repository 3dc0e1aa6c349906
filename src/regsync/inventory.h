#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include <regsync/error.h>
#include <regsync/registry.h>
#include <regsync/types.h>
#include <util/expected.h>

namespace regsync {

// a snapshot of the repositories and images of one registry account
struct inventory {
    account owner;
    // every repository visible to the credentials, including empty ones
    std::set<std::string> repositories;
    // images ordered by (repository, digest): one entry per image, with the
    // tags of all listing entries that share the digest merged.
    std::vector<registry_image> images;
    // repositories that could not be described because of missing permissions
    std::set<std::string> denied;

    // the digests in each repository
    std::map<std::string, std::set<std::string>> digests() const;
};

// fetch the inventory of an account, merging paginated listings.
//
// fails if the account could not be listed at all (auth errors, the registry
// is unavailable). A repository that can't be described because of missing
// permissions is recorded in inventory::denied, and a repository that was
// deleted while the inventory was fetched is skipped.
util::expected<inventory, error> fetch_inventory(const registry& reg);

} // namespace regsync
