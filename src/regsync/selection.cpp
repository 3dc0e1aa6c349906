#include <algorithm>
#include <chrono>
#include <string>
#include <tuple>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <regsync/selection.h>

namespace regsync {

std::size_t selection::count(rejection_reason r) const {
    return std::count_if(rejected.begin(), rejected.end(),
                         [r](const auto& x) { return x.reason == r; });
}

selection select(const inventory& source, const inventory& destination,
                 const policy& pol, scan_resolver& resolver, timestamp now) {
    using enum rejection_reason;
    using namespace std::chrono;

    selection result;
    auto reject = [&result](const registry_image& image, rejection_reason r) {
        spdlog::debug("select: {} rejected: {}", image, r);
        result.rejected.push_back({image, r});
    };

    // names in the filter that don't match a source repository are ignored
    for (auto& name : pol.filter.names) {
        if (!source.repositories.contains(name)) {
            spdlog::debug("select: the {} filter repository {} is not in {}",
                          pol.filter.kind == name_filter::allow ? "allow"
                                                                : "deny",
                          name, source.owner);
        }
    }

    // snapshot of the destination, read only after this point
    const auto present_digests = destination.digests();
    auto is_present = [&present_digests](const registry_image& image) {
        auto it = present_digests.find(image.repository);
        return it != present_digests.end() && it->second.contains(image.digest);
    };

    const auto max_age = hours{24} * pol.max_age_days;

    for (auto& image : source.images) {
        // compared at second precision: images with a push time in the
        // future are never too old
        if (floor<seconds>(now - image.pushed_at) > max_age) {
            reject(image, too_old);
            continue;
        }
        if (image.untagged() && !pol.include_untagged) {
            reject(image, untagged);
            continue;
        }
        if (!pol.filter.admits(image.repository)) {
            reject(image, filtered);
            continue;
        }
        if (is_present(image)) {
            reject(image, present);
            continue;
        }

        std::string reason = fmt::format(
            "pushed {:%Y-%m-%d %H:%M:%S}",
            time_point_cast<seconds>(image.pushed_at));
        if (pol.require_scan) {
            switch (resolver.resolve(image)) {
            case scan_verdict::failed:
                reject(image, scan_failed);
                continue;
            case scan_verdict::pending:
                reject(image, scan_pending);
                continue;
            case scan_verdict::unavailable:
                reject(image, scan_unavailable);
                continue;
            case scan_verdict::passed:
                reason += ", scan passed";
                break;
            }
        }

        result.tasks.push_back({
            .image = image,
            .destination = destination.owner,
            .repository = image.repository,
            .create_repository =
                !destination.repositories.contains(image.repository),
            .reason = std::move(reason),
        });
    }

    std::sort(result.tasks.begin(), result.tasks.end(),
              [](const transfer_task& l, const transfer_task& r) {
                  return std::tie(l.repository, l.image.pushed_at,
                                  l.image.digest) <
                         std::tie(r.repository, r.image.pushed_at,
                                  r.image.digest);
              });

    spdlog::info("select: {} images to copy, {} rejected", result.tasks.size(),
                 result.rejected.size());
    return result;
}

} // namespace regsync
