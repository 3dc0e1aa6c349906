#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <regsync/error.h>
#include <regsync/types.h>
#include <util/expected.h>

namespace regsync {

// one page of a paginated listing.
// next_token is set if there are more pages, and is passed back to the
// registry to request the next page.
template <typename T> struct page {
    std::vector<T> items;
    std::optional<std::string> next_token;
};

using repository_page = page<std::string>;
using image_page = page<registry_image>;

// vulnerability finding severity, in increasing order
enum class severity { undefined, informational, low, medium, high, critical };

// the raw result of a scan of an image
struct scan_findings {
    // the scan status reported by the registry, e.g. COMPLETE, PENDING, FAILED
    std::string status;
    // the number of findings of each severity
    std::map<severity, unsigned> counts;
};

// short lived credentials for pushing and pulling images
struct auth_token {
    std::string username;
    std::string password;
    // the registry host name, e.g. 123456789012.dkr.ecr.eu-west-1.amazonaws.com
    std::string endpoint;
    timestamp expires_at;
};

// Concept for registry implementations.
// Any type T that implements these operations can be used as a registry.
template <typename T>
concept RegistryImpl =
    requires(const T registry, const std::string& repo,
             const std::optional<std::string>& token) {
        { registry.owner() } -> std::convertible_to<account>;
        {
            registry.list_repositories(token)
        } -> std::convertible_to<util::expected<repository_page, error>>;
        {
            registry.list_images(repo, token)
        } -> std::convertible_to<util::expected<image_page, error>>;
        {
            registry.describe_scan(repo, repo)
        } -> std::convertible_to<util::expected<scan_findings, error>>;
        {
            registry.get_token()
        } -> std::convertible_to<util::expected<auth_token, error>>;
        {
            registry.create_repository(repo)
        } -> std::convertible_to<util::expected<void, error>>;
    };

// Type-erased registry class using value semantics
class registry {
  public:
    template <RegistryImpl T>
    registry(T impl) : impl_(std::make_unique<wrap<T>>(std::move(impl))) {
    }

    registry(registry&& other) = default;

    registry(const registry& other) : impl_(other.impl_->clone()) {
    }

    registry& operator=(registry&& other) = default;
    registry& operator=(const registry& other) {
        return *this = registry(other);
    }

    // the account that the registry belongs to
    account owner() const {
        return impl_->owner();
    }

    // list one page of the repositories visible to the credentials
    util::expected<repository_page, error>
    list_repositories(const std::optional<std::string>& token) const {
        return impl_->list_repositories(token);
    }

    // list one page of the images in a repository
    util::expected<image_page, error>
    list_images(const std::string& repository,
                const std::optional<std::string>& token) const {
        return impl_->list_images(repository, token);
    }

    util::expected<scan_findings, error>
    describe_scan(const std::string& repository,
                  const std::string& digest) const {
        return impl_->describe_scan(repository, digest);
    }

    util::expected<auth_token, error> get_token() const {
        return impl_->get_token();
    }

    util::expected<void, error>
    create_repository(const std::string& repository) const {
        return impl_->create_repository(repository);
    }

  private:
    struct interface {
        virtual ~interface() = default;
        virtual std::unique_ptr<interface> clone() = 0;
        virtual account owner() const = 0;
        virtual util::expected<repository_page, error>
        list_repositories(const std::optional<std::string>&) const = 0;
        virtual util::expected<image_page, error>
        list_images(const std::string&,
                    const std::optional<std::string>&) const = 0;
        virtual util::expected<scan_findings, error>
        describe_scan(const std::string&, const std::string&) const = 0;
        virtual util::expected<auth_token, error> get_token() const = 0;
        virtual util::expected<void, error>
        create_repository(const std::string&) const = 0;
    };

    std::unique_ptr<interface> impl_;

    template <RegistryImpl T> struct wrap : interface {
        explicit wrap(const T& impl) : wrapped(impl) {
        }
        explicit wrap(T&& impl) : wrapped(std::move(impl)) {
        }

        virtual std::unique_ptr<interface> clone() override {
            return std::make_unique<wrap<T>>(wrapped);
        }

        virtual account owner() const override {
            return wrapped.owner();
        }

        virtual util::expected<repository_page, error> list_repositories(
            const std::optional<std::string>& token) const override {
            return wrapped.list_repositories(token);
        }

        virtual util::expected<image_page, error>
        list_images(const std::string& repository,
                    const std::optional<std::string>& token) const override {
            return wrapped.list_images(repository, token);
        }

        virtual util::expected<scan_findings, error>
        describe_scan(const std::string& repository,
                      const std::string& digest) const override {
            return wrapped.describe_scan(repository, digest);
        }

        virtual util::expected<auth_token, error> get_token() const override {
            return wrapped.get_token();
        }

        virtual util::expected<void, error>
        create_repository(const std::string& repository) const override {
            return wrapped.create_repository(repository);
        }

        T wrapped;
    };
};

} // namespace regsync

template <> class fmt::formatter<regsync::severity> {
  public:
    // parse format specification and store it:
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.end();
    }
    // format a value using stored specification:
    template <typename FmtContext>
    constexpr auto format(regsync::severity s, FmtContext& ctx) const {
        using enum regsync::severity;
        switch (s) {
        case undefined:
            return fmt::format_to(ctx.out(), "undefined");
        case informational:
            return fmt::format_to(ctx.out(), "informational");
        case low:
            return fmt::format_to(ctx.out(), "low");
        case medium:
            return fmt::format_to(ctx.out(), "medium");
        case high:
            return fmt::format_to(ctx.out(), "high");
        case critical:
            return fmt::format_to(ctx.out(), "critical");
        }
        return fmt::format_to(ctx.out(), "unknown");
    }
};
