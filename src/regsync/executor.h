#pragma once

#include <memory>

#include <regsync/error.h>
#include <regsync/registry.h>
#include <regsync/types.h>
#include <util/expected.h>

namespace regsync {

// Concept for image transfer executors, which move image data between
// registries through local storage.
template <typename T>
concept ExecutorImpl = requires(const T executor, const image_ref& ref,
                                const auth_token& creds) {
    {
        executor.pull(ref, creds)
    } -> std::convertible_to<util::expected<void, error>>;
    {
        executor.tag(ref, ref)
    } -> std::convertible_to<util::expected<void, error>>;
    {
        executor.push(ref, creds)
    } -> std::convertible_to<util::expected<void, error>>;
    {
        executor.remove(ref)
    } -> std::convertible_to<util::expected<void, error>>;
    {
        executor.exists(ref, creds)
    } -> std::convertible_to<util::expected<bool, error>>;
};

// Type-erased transfer executor using value semantics
class executor {
  public:
    template <ExecutorImpl T>
    executor(T impl) : impl_(std::make_unique<wrap<T>>(std::move(impl))) {
    }

    executor(executor&& other) = default;

    executor(const executor& other) : impl_(other.impl_->clone()) {
    }

    executor& operator=(executor&& other) = default;
    executor& operator=(const executor& other) {
        return *this = executor(other);
    }

    // pull an image to local storage
    util::expected<void, error> pull(const image_ref& ref,
                                     const auth_token& creds) const {
        return impl_->pull(ref, creds);
    }

    // add a reference to a local image
    util::expected<void, error> tag(const image_ref& source,
                                    const image_ref& target) const {
        return impl_->tag(source, target);
    }

    // push a local image to a registry
    util::expected<void, error> push(const image_ref& ref,
                                     const auth_token& creds) const {
        return impl_->push(ref, creds);
    }

    // remove a reference to a local image
    util::expected<void, error> remove(const image_ref& ref) const {
        return impl_->remove(ref);
    }

    // check whether a registry has the manifest of an image, without pulling
    util::expected<bool, error> exists(const image_ref& ref,
                                       const auth_token& creds) const {
        return impl_->exists(ref, creds);
    }

  private:
    struct interface {
        virtual ~interface() = default;
        virtual std::unique_ptr<interface> clone() = 0;
        virtual util::expected<void, error>
        pull(const image_ref&, const auth_token&) const = 0;
        virtual util::expected<void, error> tag(const image_ref&,
                                                const image_ref&) const = 0;
        virtual util::expected<void, error>
        push(const image_ref&, const auth_token&) const = 0;
        virtual util::expected<void, error> remove(const image_ref&) const = 0;
        virtual util::expected<bool, error>
        exists(const image_ref&, const auth_token&) const = 0;
    };

    std::unique_ptr<interface> impl_;

    template <ExecutorImpl T> struct wrap : interface {
        explicit wrap(const T& impl) : wrapped(impl) {
        }
        explicit wrap(T&& impl) : wrapped(std::move(impl)) {
        }

        virtual std::unique_ptr<interface> clone() override {
            return std::make_unique<wrap<T>>(wrapped);
        }

        virtual util::expected<void, error>
        pull(const image_ref& ref, const auth_token& creds) const override {
            return wrapped.pull(ref, creds);
        }

        virtual util::expected<void, error>
        tag(const image_ref& source, const image_ref& target) const override {
            return wrapped.tag(source, target);
        }

        virtual util::expected<void, error>
        push(const image_ref& ref, const auth_token& creds) const override {
            return wrapped.push(ref, creds);
        }

        virtual util::expected<void, error>
        remove(const image_ref& ref) const override {
            return wrapped.remove(ref);
        }

        virtual util::expected<bool, error>
        exists(const image_ref& ref, const auth_token& creds) const override {
            return wrapped.exists(ref, creds);
        }

        T wrapped;
    };
};

} // namespace regsync
