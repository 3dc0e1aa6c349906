#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <regsync/error.h>
#include <regsync/registry.h>
#include <regsync/types.h>
#include <util/expected.h>
#include <util/subprocess.h>

namespace regsync {
namespace aws {

// a registry backed by the aws command line tool.
// every call runs `aws ecr ...` with the profile and region of the account,
// and parses the JSON written to stdout.
class aws_registry {
  public:
    aws_registry(account acct, std::filesystem::path aws_exe,
                 std::chrono::milliseconds api_timeout, bool scan_on_push);

    account owner() const;

    util::expected<repository_page, error>
    list_repositories(const std::optional<std::string>& token) const;

    util::expected<image_page, error>
    list_images(const std::string& repository,
                const std::optional<std::string>& token) const;

    util::expected<scan_findings, error>
    describe_scan(const std::string& repository,
                  const std::string& digest) const;

    util::expected<auth_token, error> get_token() const;

    util::expected<void, error>
    create_repository(const std::string& repository) const;

  private:
    account account_;
    std::filesystem::path aws_;
    std::chrono::milliseconds timeout_;
    bool scan_on_push_;

    util::expected<util::subprocess_output, error>
    run(std::vector<std::string> args) const;
};

// page size used for all paginated aws calls
constexpr unsigned page_size = 100;

// Convert the output of a failed aws call to a regsync::error.
// The aws tool returns 255 for service errors, and 252/253 for invalid
// arguments or configuration, so stderr is parsed for the name of the service
// exception to classify the error.
error create_error(const util::subprocess_output& result,
                   const std::string& context);

// parse the JSON output of the aws tool.
// exposed for testing.
util::expected<repository_page, error>
parse_repository_page(const std::string& json);

util::expected<image_page, error> parse_image_page(const std::string& json,
                                                   const account& owner);

util::expected<scan_findings, error>
parse_scan_findings(const std::string& json);

// the login credentials and registry host name of an account, from the output
// of `aws ecr get-authorization-token`
util::expected<auth_token, error>
parse_authorization_token(const std::string& json);

} // namespace aws
} // namespace regsync
