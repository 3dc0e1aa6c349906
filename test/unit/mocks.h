#pragma once

#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

#include <regsync/error.h>
#include <regsync/registry.h>
#include <regsync/types.h>
#include <util/expected.h>

// in-memory implementations of the registry and transfer executor, used to
// test the engine without the aws and docker command line tools.
//
// copies of a mock share their state, so that tests can inspect the calls made
// through a type erased registry or executor.
namespace mock {

using namespace std::chrono_literals;

inline regsync::timestamp days_ago(regsync::timestamp now, int days) {
    return now - std::chrono::hours(24) * days;
}

inline regsync::registry_image image(std::string repository,
                                     std::string digest,
                                     std::set<std::string> tags,
                                     regsync::timestamp pushed_at,
                                     regsync::account owner = {"src",
                                                               "us-east-1"}) {
    return {std::move(repository), std::move(digest), std::move(tags),
            pushed_at, std::move(owner)};
}

inline regsync::error make_error(regsync::error_kind kind,
                                 std::string msg = "injected") {
    return {kind, std::move(msg), {}};
}

struct registry_state {
    std::mutex mutex;
    regsync::account owner;
    // repository -> the entries returned by list_images
    std::map<std::string, std::vector<regsync::registry_image>> repositories;
    std::size_t page_size = 2;

    // errors returned by list_repositories before it succeeds
    std::deque<regsync::error> list_repositories_errors;
    // repository -> error returned by list_images
    std::map<std::string, regsync::error> list_images_errors;

    // digest -> findings
    std::map<std::string, regsync::scan_findings> scans;
    // digest -> error returned by describe_scan
    std::map<std::string, regsync::error> scan_errors;

    std::optional<regsync::error> token_error;
    std::chrono::seconds token_lifetime = 12h;

    std::optional<regsync::error> create_error;
    std::vector<std::string> created;

    unsigned list_repositories_calls = 0;
    unsigned list_images_calls = 0;
    unsigned scan_queries = 0;
    unsigned token_requests = 0;
};

class registry {
  public:
    explicit registry(regsync::account owner)
        : state_(std::make_shared<registry_state>()) {
        state_->owner = std::move(owner);
    }

    registry_state& state() const {
        return *state_;
    }

    // add a listing entry for an image, creating the repository if needed
    void add(regsync::registry_image img) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        img.owner = state_->owner;
        state_->repositories[img.repository].push_back(std::move(img));
    }

    void add_repository(const std::string& name) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->repositories[name];
    }

    void set_scan(const std::string& digest, std::string status,
                  std::map<regsync::severity, unsigned> counts = {}) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->scans[digest] = {std::move(status), std::move(counts)};
    }

    std::string endpoint() const {
        return fmt::format("{}.{}.registry.test", state_->owner.profile,
                           state_->owner.region);
    }

    regsync::account owner() const {
        return state_->owner;
    }

    util::expected<regsync::repository_page, regsync::error>
    list_repositories(const std::optional<std::string>& token) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->list_repositories_calls;
        if (!state_->list_repositories_errors.empty()) {
            auto e = state_->list_repositories_errors.front();
            state_->list_repositories_errors.pop_front();
            return util::unexpected(e);
        }
        std::vector<std::string> names;
        for (auto& [name, _] : state_->repositories) {
            names.push_back(name);
        }
        return paginate(names, token);
    }

    util::expected<regsync::image_page, regsync::error>
    list_images(const std::string& repository,
                const std::optional<std::string>& token) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->list_images_calls;
        if (auto it = state_->list_images_errors.find(repository);
            it != state_->list_images_errors.end()) {
            return util::unexpected(it->second);
        }
        auto it = state_->repositories.find(repository);
        if (it == state_->repositories.end()) {
            return util::unexpected(
                make_error(regsync::error_kind::not_found, repository));
        }
        return paginate(it->second, token);
    }

    util::expected<regsync::scan_findings, regsync::error>
    describe_scan(const std::string&, const std::string& digest) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->scan_queries;
        if (auto it = state_->scan_errors.find(digest);
            it != state_->scan_errors.end()) {
            return util::unexpected(it->second);
        }
        if (auto it = state_->scans.find(digest); it != state_->scans.end()) {
            return it->second;
        }
        return util::unexpected(
            make_error(regsync::error_kind::not_found, "ScanNotFoundException"));
    }

    util::expected<regsync::auth_token, regsync::error> get_token() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->token_requests;
        if (state_->token_error) {
            return util::unexpected(*state_->token_error);
        }
        return regsync::auth_token{
            "AWS", fmt::format("token-{}", state_->token_requests), endpoint(),
            std::chrono::system_clock::now() + state_->token_lifetime};
    }

    util::expected<void, regsync::error>
    create_repository(const std::string& repository) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->create_error) {
            return util::unexpected(*state_->create_error);
        }
        if (state_->repositories.contains(repository)) {
            return util::unexpected(
                make_error(regsync::error_kind::already_exists, repository));
        }
        state_->repositories[repository];
        state_->created.push_back(repository);
        return {};
    }

  private:
    std::shared_ptr<registry_state> state_;

    template <typename T>
    regsync::page<T> paginate(const std::vector<T>& items,
                              const std::optional<std::string>& token) const {
        const std::size_t first = token ? std::stoul(*token) : 0;
        const std::size_t last =
            std::min(items.size(), first + state_->page_size);
        regsync::page<T> p;
        for (auto i = first; i < last; ++i) {
            p.items.push_back(items[i]);
        }
        if (last < items.size()) {
            p.next_token = std::to_string(last);
        }
        return p;
    }
};

struct executor_state {
    std::mutex mutex;
    // "repository@digest" of the images in the destination registry
    std::set<std::string> present;
    // local tag reference -> digest
    std::map<std::string, std::string> local;
    // every call, e.g. "pull src.us-east-1.registry.test/app@sha256:..."
    std::vector<std::string> calls;
    // the destination references that were pushed
    std::set<std::string> pushed;
    // the passwords used to push
    std::vector<std::string> push_passwords;

    // digest -> errors returned by pull or push before they succeed
    std::map<std::string, std::deque<regsync::error>> pull_errors;
    std::map<std::string, std::deque<regsync::error>> push_errors;
    // destination reference -> errors returned by push before it succeeds
    std::map<std::string, std::deque<regsync::error>> push_ref_errors;
    std::optional<regsync::error> exists_error;

    unsigned concurrent = 0;
    unsigned max_concurrent = 0;
    // time taken by each push
    std::chrono::milliseconds push_delay{0};
};

class executor {
  public:
    executor() : state_(std::make_shared<executor_state>()) {
    }

    executor_state& state() const {
        return *state_;
    }

    void mark_present(const std::string& repository,
                      const std::string& digest) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->present.insert(repository + "@" + digest);
    }

    unsigned count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        unsigned n = 0;
        for (auto& c : state_->calls) {
            n += c.starts_with(prefix);
        }
        return n;
    }

    util::expected<void, regsync::error>
    pull(const regsync::image_ref& ref, const regsync::auth_token&) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->calls.push_back("pull " + ref.string());
        const auto digest = ref.digest.value_or("");
        if (auto e = pop(state_->pull_errors, digest)) {
            return util::unexpected(*e);
        }
        state_->local[ref.string()] = digest;
        return {};
    }

    util::expected<void, regsync::error>
    tag(const regsync::image_ref& source,
        const regsync::image_ref& target) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->calls.push_back("tag " + target.string());
        state_->local[target.string()] = state_->local[source.string()];
        return {};
    }

    util::expected<void, regsync::error>
    push(const regsync::image_ref& ref,
         const regsync::auth_token& creds) const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            ++state_->concurrent;
            state_->max_concurrent =
                std::max(state_->max_concurrent, state_->concurrent);
        }
        if (state_->push_delay.count()) {
            std::this_thread::sleep_for(state_->push_delay);
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        --state_->concurrent;
        state_->calls.push_back("push " + ref.string());
        state_->push_passwords.push_back(creds.password);
        const auto digest = state_->local[ref.string()];
        if (auto e = pop(state_->push_errors, digest)) {
            return util::unexpected(*e);
        }
        if (auto e = pop(state_->push_ref_errors, ref.string())) {
            return util::unexpected(*e);
        }
        state_->present.insert(ref.repository + "@" + digest);
        state_->pushed.insert(ref.string());
        return {};
    }

    util::expected<void, regsync::error>
    remove(const regsync::image_ref& ref) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->calls.push_back("remove " + ref.string());
        state_->local.erase(ref.string());
        return {};
    }

    util::expected<bool, regsync::error>
    exists(const regsync::image_ref& ref, const regsync::auth_token&) const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->calls.push_back("exists " + ref.string());
        if (state_->exists_error) {
            return util::unexpected(*state_->exists_error);
        }
        return state_->present.contains(ref.repository + "@" +
                                        ref.digest.value_or(""));
    }

  private:
    std::shared_ptr<executor_state> state_;

    static std::optional<regsync::error>
    pop(std::map<std::string, std::deque<regsync::error>>& errors,
        const std::string& digest) {
        auto it = errors.find(digest);
        if (it == errors.end() || it->second.empty()) {
            return std::nullopt;
        }
        auto e = it->second.front();
        it->second.pop_front();
        return e;
    }
};

} // namespace mock
