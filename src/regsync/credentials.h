#pragma once

#include <chrono>
#include <mutex>
#include <optional>

#include <regsync/error.h>
#include <regsync/registry.h>
#include <util/expected.h>

namespace regsync {

// Caches the short lived token of one registry account for use by concurrent
// transfers.
//
// The token is refreshed when it is within refresh_margin of expiring, or
// after it has been invalidated, e.g. when the registry rejected it.
// If the registry refuses to issue a token with an auth or permission error,
// the account is marked failed: every later request fails immediately with
// the same error, without calling the registry again.
class credential_cache {
  public:
    explicit credential_cache(
        registry reg,
        std::chrono::seconds refresh_margin = std::chrono::minutes(5));

    credential_cache(const credential_cache&) = delete;
    credential_cache& operator=(const credential_cache&) = delete;

    util::expected<auth_token, error> get();

    // discard the cached token, so that the next call to get fetches a new one
    void invalidate();

    // true if the account could not be authenticated
    bool failed() const;

    account owner() const;

  private:
    registry registry_;
    std::chrono::seconds margin_;

    // held while a token is fetched, so that concurrent callers wait for one
    // refresh instead of each fetching a token.
    mutable std::mutex mutex_;
    std::optional<auth_token> token_;
    std::optional<error> failure_;
};

} // namespace regsync
