#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <regsync/aws.h>
#include <regsync/log.h>
#include <regsync/parse.h>
#include <util/base64.h>
#include <util/expected.h>
#include <util/strings.h>
#include <util/subprocess.h>

namespace regsync {
namespace aws {

using json = nlohmann::json;

error create_error(const util::subprocess_output& result,
                   const std::string& context) {
    using enum error_kind;
    using util::contains;

    const std::string_view err = result.err;
    auto make = [&](error_kind kind, std::string_view message) -> error {
        return {kind, fmt::format("{}: {}", context, message),
                util::strip(result.err)};
    };

    if (result.timed_out) {
        return make(registry_unavailable, "the aws call timed out");
    }
    if (contains(err, "ExpiredToken") ||
        contains(err, "UnrecognizedClient") ||
        contains(err, "InvalidClientTokenId") ||
        contains(err, "InvalidSignature") ||
        contains(err, "SignatureDoesNotMatch")) {
        return make(auth, "the credentials are invalid or have expired");
    }
    if (contains(err, "Unable to locate credentials") ||
        contains(err, "could not be found")) {
        return make(auth, "no credentials were found for the profile");
    }
    if (contains(err, "AccessDenied") ||
        contains(err, "not authorized to perform")) {
        return make(permission_denied,
                    "the credentials do not grant permission for the action");
    }
    if (contains(err, "RepositoryNotFound")) {
        return make(not_found, "the repository does not exist");
    }
    if (contains(err, "ImageNotFound")) {
        return make(not_found, "the image does not exist");
    }
    if (contains(err, "ScanNotFound")) {
        return make(not_found, "no scan has been recorded for the image");
    }
    if (contains(err, "RepositoryAlreadyExists")) {
        return make(already_exists, "the repository already exists");
    }
    if (contains(err, "Could not connect to the endpoint") ||
        contains(err, "ThrottlingException") ||
        contains(err, "ServiceUnavailable") ||
        contains(err, "ServerException") ||
        contains(err, "Connect timeout") || contains(err, "Read timeout")) {
        return make(registry_unavailable, "the registry service is unavailable");
    }
    return make(registry_unavailable,
                fmt::format("aws returned an unexpected error (code {})",
                            result.returncode));
}

aws_registry::aws_registry(account acct, std::filesystem::path aws_exe,
                           std::chrono::milliseconds api_timeout,
                           bool scan_on_push)
    : account_(std::move(acct)), aws_(std::move(aws_exe)),
      timeout_(api_timeout), scan_on_push_(scan_on_push) {
}

account aws_registry::owner() const {
    return account_;
}

util::expected<util::subprocess_output, error>
aws_registry::run(std::vector<std::string> args) const {
    const auto context = fmt::format("aws {} ({})", args.front(), account_);

    args.insert(args.begin(), {aws_.string(), "ecr"});
    args.insert(args.end(), {"--profile", account_.profile, "--region",
                             account_.region, "--output", "json"});
    spdlog::trace("run_aws: {}", fmt::join(args, " "));

    auto proc = util::run(args);
    if (!proc) {
        return util::unexpected(error{error_kind::internal,
                                      fmt::format("{}: {}", context,
                                                  proc.error()),
                                      {}});
    }

    auto result = proc->communicate(std::nullopt, timeout_);
    if (result.returncode != 0 || result.timed_out) {
        spdlog::debug("run_aws: {} returncode={} stderr='{}'", context,
                      result.returncode, util::strip(result.err));
        return util::unexpected(create_error(result, context));
    }

    return result;
}

static std::vector<std::string>
with_token(std::vector<std::string> args,
           const std::optional<std::string>& token) {
    args.insert(args.end(), {"--max-items", std::to_string(page_size)});
    if (token) {
        args.insert(args.end(), {"--starting-token", *token});
    }
    return args;
}

util::expected<repository_page, error> aws_registry::list_repositories(
    const std::optional<std::string>& token) const {
    auto result = run(with_token({"describe-repositories"}, token));
    if (!result) {
        return util::unexpected(result.error());
    }
    return parse_repository_page(result->out);
}

util::expected<image_page, error>
aws_registry::list_images(const std::string& repository,
                          const std::optional<std::string>& token) const {
    auto result = run(with_token(
        {"describe-images", "--repository-name", repository}, token));
    if (!result) {
        return util::unexpected(result.error());
    }
    return parse_image_page(result->out, account_);
}

util::expected<scan_findings, error>
aws_registry::describe_scan(const std::string& repository,
                            const std::string& digest) const {
    // only the summary counts are required, which are returned with the first
    // page of findings
    auto result = run({"describe-image-scan-findings", "--repository-name",
                       repository, "--image-id",
                       fmt::format("imageDigest={}", digest), "--max-items",
                       "1"});
    if (!result) {
        return util::unexpected(result.error());
    }
    return parse_scan_findings(result->out);
}

util::expected<auth_token, error> aws_registry::get_token() const {
    auto result = run({"get-authorization-token"});
    if (!result) {
        return util::unexpected(result.error());
    }
    auto token = parse_authorization_token(result->out);
    if (!token) {
        return util::unexpected(token.error());
    }
    spdlog::debug("aws::get_token {} endpoint {} expires {} token {}", account_,
                  token->endpoint, token->expires_at,
                  sensitive{token->password});

    return token;
}

util::expected<void, error>
aws_registry::create_repository(const std::string& repository) const {
    auto result = run(
        {"create-repository", "--repository-name", repository,
         "--image-scanning-configuration",
         fmt::format("scanOnPush={}", scan_on_push_ ? "true" : "false")});
    if (!result) {
        return util::unexpected(result.error());
    }
    spdlog::info("created repository {} in {} (scan on push {})", repository,
                 account_, scan_on_push_);
    return {};
}

static error parse_error(std::string_view what, const std::exception& e,
                         const std::string& raw) {
    return {error_kind::internal,
            fmt::format("unable to parse the output of aws {}: {}", what,
                        e.what()),
            raw};
}

static std::optional<std::string> next_token(const json& j) {
    if (auto it = j.find("NextToken"); it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

util::expected<repository_page, error>
parse_repository_page(const std::string& raw) {
    repository_page page;
    try {
        const auto j = json::parse(raw);
        for (const auto& r : j.at("repositories")) {
            page.items.push_back(r.at("repositoryName").get<std::string>());
        }
        page.next_token = next_token(j);
    } catch (std::exception& e) {
        spdlog::error("unable to parse aws describe-repositories json: {}",
                      e.what());
        return util::unexpected(parse_error("describe-repositories", e, raw));
    }
    return page;
}

util::expected<image_page, error> parse_image_page(const std::string& raw,
                                                   const account& owner) {
    using namespace std::chrono;

    image_page page;
    try {
        const auto j = json::parse(raw);
        for (const auto& d : j.at("imageDetails")) {
            registry_image image;
            image.owner = owner;
            image.repository = d.at("repositoryName").get<std::string>();
            image.digest = d.at("imageDigest").get<std::string>();
            if (auto tags = d.find("imageTags"); tags != d.end()) {
                for (const auto& t : *tags) {
                    image.tags.insert(t.get<std::string>());
                }
            }

            // aws cli v1 prints seconds since the epoch as a number, v2
            // prints an ISO 8601 string
            const auto& pushed = d.at("imagePushedAt");
            if (pushed.is_number()) {
                image.pushed_at = timestamp{duration_cast<system_clock::duration>(
                    duration<double>(pushed.get<double>()))};
            } else if (auto t = parse_timestamp(pushed.get<std::string>())) {
                image.pushed_at = *t;
            } else {
                return util::unexpected(error{
                    error_kind::internal,
                    fmt::format("unable to parse the push time of {}: {}",
                                image, t.error()),
                    raw});
            }

            page.items.push_back(std::move(image));
        }
        page.next_token = next_token(j);
    } catch (std::exception& e) {
        spdlog::error("unable to parse aws describe-images json: {}",
                      e.what());
        return util::unexpected(parse_error("describe-images", e, raw));
    }
    return page;
}

util::expected<scan_findings, error>
parse_scan_findings(const std::string& raw) {
    scan_findings findings;
    try {
        const auto j = json::parse(raw);
        findings.status =
            j.at("imageScanStatus").at("status").get<std::string>();
        if (auto f = j.find("imageScanFindings"); f != j.end()) {
            if (auto c = f->find("findingSeverityCounts"); c != f->end()) {
                for (const auto& [name, count] : c->items()) {
                    if (auto s = parse_severity(name)) {
                        findings.counts[*s] += count.get<unsigned>();
                    } else {
                        spdlog::warn("ignoring unknown scan severity '{}'",
                                     name);
                    }
                }
            }
        }
    } catch (std::exception& e) {
        spdlog::error("unable to parse aws describe-image-scan-findings json: "
                      "{}",
                      e.what());
        return util::unexpected(
            parse_error("describe-image-scan-findings", e, raw));
    }
    return findings;
}

util::expected<auth_token, error>
parse_authorization_token(const std::string& raw) {
    using namespace std::chrono;

    auto invalid = [&raw](std::string msg) {
        return util::unexpected(
            error{error_kind::internal,
                  fmt::format("invalid aws get-authorization-token output: {}",
                              msg),
                  raw});
    };

    auth_token token;
    try {
        const auto j = json::parse(raw);
        const auto& data = j.at("authorizationData").at(0);

        // the token is the base64 encoding of "user:password"
        const auto encoded = data.at("authorizationToken").get<std::string>();
        auto credentials = util::base64_decode(encoded);
        if (!credentials) {
            return invalid(credentials.error());
        }
        const auto colon = credentials->find(':');
        if (colon == std::string::npos || colon == 0 ||
            colon + 1 == credentials->size()) {
            return invalid("the token is not of the form user:password");
        }
        token.username = credentials->substr(0, colon);
        token.password = credentials->substr(colon + 1);

        // docker expects the host name, not the https://... url
        const auto url = data.at("proxyEndpoint").get<std::string>();
        std::string_view endpoint = url;
        for (std::string_view scheme : {"https://", "http://"}) {
            if (endpoint.starts_with(scheme)) {
                endpoint.remove_prefix(scheme.size());
            }
        }
        while (endpoint.ends_with('/')) {
            endpoint.remove_suffix(1);
        }
        if (endpoint.empty()) {
            return invalid("empty proxy endpoint");
        }
        token.endpoint = std::string(endpoint);

        // aws cli v1 prints seconds since the epoch as a number, v2
        // prints an ISO 8601 string
        const auto& expires = data.at("expiresAt");
        if (expires.is_number()) {
            token.expires_at = timestamp{duration_cast<system_clock::duration>(
                duration<double>(expires.get<double>()))};
        } else if (auto t = parse_timestamp(expires.get<std::string>())) {
            token.expires_at = *t;
        } else {
            return invalid(fmt::format("expiresAt: {}", t.error()));
        }
    } catch (std::exception& e) {
        spdlog::error("unable to parse aws get-authorization-token json: {}",
                      e.what());
        return util::unexpected(parse_error("get-authorization-token", e, raw));
    }
    return token;
}

} // namespace aws
} // namespace regsync
