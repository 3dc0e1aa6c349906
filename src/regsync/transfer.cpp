#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <regsync/transfer.h>
#include <regsync/types.h>
#include <util/defer.h>

namespace regsync {

transfer_driver::transfer_driver(executor exec, registry destination,
                                 credential_cache& source_credentials,
                                 credential_cache& destination_credentials,
                                 retry_policy retry)
    : executor_(std::move(exec)), destination_(std::move(destination)),
      source_credentials_(source_credentials),
      destination_credentials_(destination_credentials), retry_(retry) {
}

transfer_outcome transfer_driver::execute(const transfer_task& task) const {
    transfer_outcome outcome{.task = task};
    bool stale_token = false;
    bool pushed = false;

    auto result = retry_.apply(
        [&](unsigned attempt_number) {
            outcome.attempts = attempt_number;
            stale_token = false;
            return attempt(task, stale_token, pushed);
        },
        [&stale_token](const error& e) {
            return e.retryable() || (e.kind == error_kind::auth && stale_token);
        });

    if (result) {
        outcome.status = *result;
        spdlog::info("transfer {}: {} after {} attempt(s)", task, *result,
                     outcome.attempts);
    } else {
        outcome.status = transfer_status::failed;
        outcome.failure = result.error();
        spdlog::warn("transfer {}: failed after {} attempt(s): {}", task,
                     outcome.attempts, result.error());
    }
    return outcome;
}

util::expected<transfer_status, error>
transfer_driver::attempt(const transfer_task& task, bool& stale_token,
                         bool& pushed) const {
    const auto& image = task.image;

    auto src = source_credentials_.get();
    if (!src) {
        return util::unexpected(src.error());
    }
    auto dst = destination_credentials_.get();
    if (!dst) {
        return util::unexpected(dst.error());
    }

    // the image may have been copied since the inventory was taken.
    // once one of our own pushes has landed the digest is present even though
    // some tags are still missing, so the retry pushes every tag again.
    if (!pushed) {
        const image_ref dst_digest_ref{dst->endpoint, task.repository,
                                       std::nullopt, image.digest};
        if (auto exists = executor_.exists(dst_digest_ref, *dst); !exists) {
            spdlog::warn("transfer {}: unable to check whether the destination "
                         "has the image: {}",
                         task, exists.error());
        } else if (*exists) {
            return transfer_status::skipped;
        }
    }

    if (task.create_repository) {
        if (auto r = destination_.create_repository(task.repository); !r) {
            if (r.error().kind != error_kind::already_exists) {
                return util::unexpected(r.error());
            }
            spdlog::debug("transfer {}: the repository {} already exists",
                          task, task.repository);
        }
    }

    const image_ref src_ref{src->endpoint, image.repository, std::nullopt,
                            image.digest};
    if (auto r = executor_.pull(src_ref, *src); !r) {
        if (r.error().kind == error_kind::auth) {
            source_credentials_.invalidate();
            stale_token = true;
        }
        return util::unexpected(r.error());
    }

    // every reference to the image in local storage, removed on exit
    std::vector<image_ref> local{src_ref};
    auto cleanup = util::defer([this, &local, &task]() {
        for (auto& ref : local) {
            if (auto r = executor_.remove(ref); !r) {
                spdlog::warn("transfer {}: unable to remove local image {}: {}",
                             task, ref, r.error());
            }
        }
    });

    std::vector<std::string> tags(image.tags.begin(), image.tags.end());
    if (tags.empty()) {
        // an image can't be pushed by digest alone
        tags.push_back(untagged_tag(image.digest));
    }

    std::vector<image_ref> targets;
    for (auto& tag : tags) {
        image_ref target{dst->endpoint, task.repository, tag, std::nullopt};
        if (auto r = executor_.tag(src_ref, target); !r) {
            return util::unexpected(r.error());
        }
        local.push_back(target);
        targets.push_back(std::move(target));
    }

    for (auto& target : targets) {
        if (auto r = executor_.push(target, *dst); !r) {
            if (r.error().kind == error_kind::auth) {
                destination_credentials_.invalidate();
                stale_token = true;
            }
            return util::unexpected(r.error());
        }
        pushed = true;
    }

    return transfer_status::copied;
}

} // namespace regsync
