#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <regsync/docker.h>
#include <regsync/log.h>
#include <util/curl.h>
#include <util/expected.h>
#include <util/strings.h>
#include <util/subprocess.h>

namespace regsync {
namespace docker {

error create_error(const util::subprocess_output& result,
                   const std::string& context, error_kind default_kind) {
    using enum error_kind;
    using util::contains;

    const auto err = util::to_lower(result.err);
    auto make = [&](error_kind kind, std::string_view message) -> error {
        return {kind, fmt::format("{}: {}", context, message),
                util::strip(result.err)};
    };

    if (result.timed_out) {
        return make(default_kind == auth ? registry_unavailable : transfer,
                    "the docker call timed out");
    }
    if (contains(err, "cannot connect to the docker daemon") ||
        contains(err, "docker daemon socket")) {
        return make(transfer, "unable to connect to the docker daemon");
    }
    if (contains(err, "authorization token has expired")) {
        return make(auth, "the registry token has expired");
    }
    if (contains(err, "not authorized to perform")) {
        return make(permission_denied,
                    "the credentials do not grant permission for the action");
    }
    if (contains(err, "no basic auth credentials") ||
        contains(err, "unauthorized") || contains(err, "denied")) {
        return make(auth, "the registry rejected the credentials");
    }
    if (contains(err, "manifest unknown") || contains(err, "name unknown") ||
        contains(err, "not found") || contains(err, "no such image")) {
        return make(not_found, "the image does not exist");
    }
    if (contains(err, "tls handshake timeout") ||
        contains(err, "i/o timeout") ||
        contains(err, "connection reset by peer") ||
        contains(err, "503 service unavailable")) {
        return make(transfer, "the connection to the registry failed");
    }
    return make(default_kind,
                fmt::format("docker returned an unexpected error (code {})",
                            result.returncode));
}

docker_executor::docker_executor(std::filesystem::path docker_exe,
                                 std::filesystem::path config_dir,
                                 std::chrono::milliseconds api_timeout,
                                 std::chrono::milliseconds transfer_timeout)
    : docker_(std::move(docker_exe)), config_dir_(std::move(config_dir)),
      api_timeout_(api_timeout), transfer_timeout_(transfer_timeout),
      logins_(std::make_shared<login_cache>()) {
}

util::expected<util::subprocess_output, error>
docker_executor::run(std::vector<std::string> args,
                     std::chrono::milliseconds timeout,
                     error_kind default_kind,
                     std::optional<std::string> input) const {
    // WARNING: the arguments are logged, so never pass secrets on the
    // command line: use input, which is written to stdin, instead.
    const auto context = fmt::format("docker {}", fmt::join(args, " "));

    args.insert(args.begin(),
                {docker_.string(), "--config", config_dir_.string()});
    spdlog::trace("run_docker: {}", fmt::join(args, " "));

    auto proc = util::run(args);
    if (!proc) {
        return util::unexpected(error{
            error_kind::internal, fmt::format("{}: {}", context, proc.error()),
            {}});
    }

    auto result = proc->communicate(std::move(input), timeout);
    if (result.returncode != 0 || result.timed_out) {
        spdlog::debug("run_docker: {} returncode={} stderr='{}'", context,
                      result.returncode, util::strip(result.err));
        return util::unexpected(create_error(result, context, default_kind));
    }

    return result;
}

util::expected<void, error>
docker_executor::login(const auth_token& creds) const {
    std::lock_guard<std::mutex> lock(logins_->mutex);

    if (auto it = logins_->tokens.find(creds.endpoint);
        it != logins_->tokens.end() && it->second == creds.password) {
        spdlog::trace("docker::login using existing login for {}",
                      creds.endpoint);
        return {};
    }

    spdlog::debug("docker::login {} as {} with token {}", creds.endpoint,
                  creds.username, sensitive{creds.password});
    auto result = run({"login", "--username", creds.username,
                       "--password-stdin", creds.endpoint},
                      api_timeout_, error_kind::auth, creds.password);
    if (!result) {
        return util::unexpected(result.error());
    }

    logins_->tokens[creds.endpoint] = creds.password;
    return {};
}

util::expected<void, error>
docker_executor::pull(const image_ref& ref, const auth_token& creds) const {
    if (auto r = login(creds); !r) {
        return r;
    }
    spdlog::info("docker::pull {}", ref);
    auto result = run({"pull", "--quiet", ref.string()}, transfer_timeout_,
                      error_kind::transfer);
    if (!result) {
        return util::unexpected(result.error());
    }
    return {};
}

util::expected<void, error> docker_executor::tag(const image_ref& source,
                                                 const image_ref& target) const {
    spdlog::debug("docker::tag {} {}", source, target);
    auto result = run({"tag", source.string(), target.string()}, api_timeout_,
                      error_kind::transfer);
    if (!result) {
        return util::unexpected(result.error());
    }
    return {};
}

util::expected<void, error>
docker_executor::push(const image_ref& ref, const auth_token& creds) const {
    if (auto r = login(creds); !r) {
        return r;
    }
    spdlog::info("docker::push {}", ref);
    auto result = run({"push", "--quiet", ref.string()}, transfer_timeout_,
                      error_kind::transfer);
    if (!result) {
        return util::unexpected(result.error());
    }
    return {};
}

util::expected<void, error>
docker_executor::remove(const image_ref& ref) const {
    spdlog::debug("docker::remove {}", ref);
    auto result = run({"image", "rm", ref.string()}, api_timeout_,
                      error_kind::transfer);
    if (!result) {
        return util::unexpected(result.error());
    }
    return {};
}

util::expected<bool, error>
docker_executor::exists(const image_ref& ref, const auth_token& creds) const {
    const auto url = manifest_url(ref);
    spdlog::debug("docker::exists HEAD {}", url);

    auto code = util::curl::head(url, {creds.username, creds.password},
                                 manifest_accept_headers(), api_timeout_);
    if (!code) {
        return util::unexpected(
            error{error_kind::registry_unavailable,
                  fmt::format("unable to look up {}: {}", ref,
                              code.error().message),
                  {}});
    }

    return manifest_status(*code, ref);
}

std::string manifest_url(const image_ref& ref) {
    return fmt::format("https://{}/v2/{}/manifests/{}", ref.endpoint,
                       ref.repository,
                       ref.digest ? *ref.digest : ref.tag.value_or("latest"));
}

const std::vector<std::string>& manifest_accept_headers() {
    static const std::vector<std::string> headers{
        "Accept: application/vnd.oci.image.manifest.v1+json",
        "Accept: application/vnd.oci.image.index.v1+json",
        "Accept: application/vnd.docker.distribution.manifest.v2+json",
        "Accept: application/vnd.docker.distribution.manifest.list.v2+json",
    };
    return headers;
}

util::expected<bool, error> manifest_status(long http_code,
                                            const image_ref& ref) {
    switch (http_code) {
    case 200:
        return true;
    case 404:
        return false;
    case 401:
    case 403:
        return util::unexpected(
            error{error_kind::auth,
                  fmt::format("the registry rejected the credentials looking "
                              "up {} (HTTP {})",
                              ref, http_code),
                  {}});
    }
    return util::unexpected(error{
        error_kind::registry_unavailable,
        fmt::format("unexpected response looking up {} (HTTP {})", ref,
                    http_code),
        {}});
}

} // namespace docker
} // namespace regsync
