#include <chrono>
#include <mutex>

#include <spdlog/spdlog.h>

#include <regsync/credentials.h>
#include <regsync/log.h>

namespace regsync {

credential_cache::credential_cache(registry reg,
                                   std::chrono::seconds refresh_margin)
    : registry_(std::move(reg)), margin_(refresh_margin) {
}

util::expected<auth_token, error> credential_cache::get() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (failure_) {
        return util::unexpected(*failure_);
    }

    const auto now = std::chrono::system_clock::now();
    if (token_ && now + margin_ < token_->expires_at) {
        return *token_;
    }

    spdlog::debug("credential_cache: requesting a token for {}",
                  registry_.owner());
    auto token = registry_.get_token();
    if (!token) {
        const auto kind = token.error().kind;
        if (kind == error_kind::auth || kind == error_kind::permission_denied) {
            spdlog::error("credential_cache: unable to authenticate {}: {}",
                          registry_.owner(), token.error());
            failure_ = token.error();
        }
        token_.reset();
        return util::unexpected(token.error());
    }

    spdlog::debug("credential_cache: token for {} {}", registry_.owner(),
                  sensitive{token->password});
    token_ = *token;
    return *token_;
}

void credential_cache::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::debug("credential_cache: invalidating token for {}",
                  registry_.owner());
    token_.reset();
}

bool credential_cache::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_.has_value();
}

account credential_cache::owner() const {
    return registry_.owner();
}

} // namespace regsync
