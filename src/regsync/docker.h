#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <regsync/error.h>
#include <regsync/registry.h>
#include <regsync/types.h>
#include <util/expected.h>
#include <util/subprocess.h>

namespace regsync {
namespace docker {

// a transfer executor backed by the docker command line tool.
//
// all calls use a private docker configuration directory, so that the logins
// performed by regsync do not modify the user's docker configuration.
// copies of the executor share one login cache, so that each registry is
// logged into once per token.
class docker_executor {
  public:
    docker_executor(std::filesystem::path docker_exe,
                    std::filesystem::path config_dir,
                    std::chrono::milliseconds api_timeout,
                    std::chrono::milliseconds transfer_timeout);

    util::expected<void, error> pull(const image_ref& ref,
                                     const auth_token& creds) const;
    util::expected<void, error> tag(const image_ref& source,
                                    const image_ref& target) const;
    util::expected<void, error> push(const image_ref& ref,
                                     const auth_token& creds) const;
    util::expected<void, error> remove(const image_ref& ref) const;
    util::expected<bool, error> exists(const image_ref& ref,
                                       const auth_token& creds) const;

  private:
    struct login_cache {
        std::mutex mutex;
        // endpoint -> the token used to log in
        std::map<std::string, std::string> tokens;
    };

    std::filesystem::path docker_;
    std::filesystem::path config_dir_;
    std::chrono::milliseconds api_timeout_;
    std::chrono::milliseconds transfer_timeout_;
    std::shared_ptr<login_cache> logins_;

    util::expected<void, error> login(const auth_token& creds) const;

    util::expected<util::subprocess_output, error>
    run(std::vector<std::string> args, std::chrono::milliseconds timeout,
        error_kind default_kind,
        std::optional<std::string> input = std::nullopt) const;
};

// Convert the output of a failed docker call to a regsync::error.
// docker returns 1 for all errors, so stderr is parsed for hints about what
// went wrong.
// default_kind is used when the error can not be classified.
error create_error(const util::subprocess_output& result,
                   const std::string& context, error_kind default_kind);

// the url of the registry API manifest of an image:
//      https://endpoint/v2/repository/manifests/reference
std::string manifest_url(const image_ref& ref);

// the Accept headers for a manifest request: without them the registry only
// answers for docker v2 schema 1 manifests.
const std::vector<std::string>& manifest_accept_headers();

// classify the HTTP status of a manifest request
util::expected<bool, error> manifest_status(long http_code,
                                            const image_ref& ref);

} // namespace docker
} // namespace regsync
