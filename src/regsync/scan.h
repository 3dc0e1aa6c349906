#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <regsync/registry.h>
#include <regsync/types.h>

namespace regsync {

// reduce the findings of a scan to a verdict.
//  - complete scans fail if there is at least one finding with severity at or
//    above threshold. If threshold is not set, complete scans always pass.
//  - scans that are queued or in progress are pending.
//  - failed scans, unsupported images, and expired or unavailable findings
//    are unavailable.
scan_verdict reduce_scan(const scan_findings& findings,
                         std::optional<severity> threshold);

// Resolves the scan verdict of images, caching the verdict of each digest for
// the lifetime of the resolver.
//
// Safe for concurrent use: concurrent requests for the same digest make one
// query, and queries for different digests run in parallel.
// Errors querying the registry never propagate: an image without a recorded
// scan is pending, and every other error gives unavailable.
class scan_resolver {
  public:
    scan_resolver(registry reg, std::optional<severity> threshold);

    scan_resolver(const scan_resolver&) = delete;
    scan_resolver& operator=(const scan_resolver&) = delete;

    scan_verdict resolve(const registry_image& image);

    // the number of queries made to the registry
    unsigned queries() const {
        return queries_.load();
    }

  private:
    struct entry {
        std::mutex mutex;
        std::optional<scan_verdict> verdict;
    };

    registry registry_;
    std::optional<severity> threshold_;

    // guards the map, not the entries
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<entry>> entries_;
    std::atomic<unsigned> queries_{0};

    scan_verdict query(const registry_image& image);
};

} // namespace regsync
