#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include <regsync/scan.h>
#include <util/strings.h>

namespace regsync {

scan_verdict reduce_scan(const scan_findings& findings,
                         std::optional<severity> threshold) {
    using enum scan_verdict;
    const auto status = util::to_lower(findings.status);

    // ACTIVE is reported for continuous (enhanced) scanning
    if (status == "complete" || status == "active") {
        if (!threshold) {
            return passed;
        }
        for (auto [sev, count] : findings.counts) {
            if (sev >= *threshold && count > 0) {
                return failed;
            }
        }
        return passed;
    }
    if (status == "pending" || status == "in_progress") {
        return pending;
    }
    // FAILED, UNSUPPORTED_IMAGE, FINDINGS_UNAVAILABLE,
    // SCAN_ELIGIBILITY_EXPIRED and any status that we don't know about
    return unavailable;
}

scan_resolver::scan_resolver(registry reg, std::optional<severity> threshold)
    : registry_(std::move(reg)), threshold_(threshold) {
}

scan_verdict scan_resolver::resolve(const registry_image& image) {
    std::shared_ptr<entry> e;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[image.digest];
        if (!slot) {
            slot = std::make_shared<entry>();
        }
        e = slot;
    }

    std::lock_guard<std::mutex> lock(e->mutex);
    if (!e->verdict) {
        e->verdict = query(image);
    }
    return *e->verdict;
}

scan_verdict scan_resolver::query(const registry_image& image) {
    ++queries_;
    auto findings = registry_.describe_scan(image.repository, image.digest);
    if (!findings) {
        if (findings.error().kind == error_kind::not_found) {
            spdlog::debug("scan_resolver: no scan recorded for {}", image);
            return scan_verdict::pending;
        }
        spdlog::warn("scan_resolver: unable to get the scan of {}: {}", image,
                     findings.error());
        return scan_verdict::unavailable;
    }

    const auto verdict = reduce_scan(*findings, threshold_);
    spdlog::debug("scan_resolver: {} status {} verdict {}", image,
                  findings->status, verdict);
    return verdict;
}

} // namespace regsync
