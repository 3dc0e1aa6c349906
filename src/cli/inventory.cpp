// vim: ts=4 sts=4 sw=4 et

#include <chrono>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <regsync/aws.h>
#include <regsync/coordinator.h>
#include <regsync/inventory.h>
#include <regsync/registry.h>
#include <regsync/settings.h>
#include <util/color.h>

#include "help.h"
#include "inventory.h"
#include "terminal.h"

namespace regsync {

std::string inventory_footer();

void inventory_args::add_cli(CLI::App& cli, global_settings& settings) {
    auto* inventory_cli = cli.add_subcommand(
        "inventory", "list the repositories and images of an account");
    inventory_cli
        ->add_option("profile", profile, "the credential profile of the account")
        ->required();
    inventory_cli->add_option("region", region, "the region of the registry")
        ->required();
    inventory_cli->callback(
        [&settings]() { settings.mode = cli_mode::inventory; });

    inventory_cli->footer(inventory_footer);
}

int list_inventory(const inventory_args& args,
                   const global_settings& settings) {
    spdlog::info("{}", args);

    auto acct = make_account(args.profile, args.region);
    if (!acct) {
        term::error("{}", acct.error().message);
        return 1;
    }
    const auto& config = settings.config;
    if (!config.aws) {
        term::error("the aws executable could not be found");
        return 1;
    }

    const registry reg = aws::aws_registry(*acct, *config.aws,
                                           config.api_timeout, false);
    auto inv = config.retry.apply(
        [&reg](unsigned) { return fetch_inventory(reg); },
        [](const error& e) { return e.retryable(); });
    if (!inv) {
        term::error("unable to list {}: {}", *acct, inv.error());
        return exit_code(fatal_report(inv.error()));
    }

    term::msg("{} repositories and {} images in {}", inv->repositories.size(),
              inv->images.size(), inv->owner);
    auto image = inv->images.begin();
    for (auto& repo : inv->repositories) {
        if (inv->denied.contains(repo)) {
            term::msg("{} {}", color::white(repo),
                      color::red("(permission denied)"));
            continue;
        }
        term::msg("{}", color::white(repo));
        while (image != inv->images.end() && image->repository < repo) {
            ++image;
        }
        for (; image != inv->images.end() && image->repository == repo;
             ++image) {
            const auto pushed =
                std::chrono::floor<std::chrono::seconds>(image->pushed_at);
            term::msg("  {}  {:%Y-%m-%d %H:%M:%S}  {}",
                      color::cyan(short_digest(image->digest)), pushed,
                      image->untagged() ? color::yellow("untagged")
                                        : fmt::format("{}", fmt::join(
                                                                image->tags,
                                                                ", ")));
        }
    }

    return 0;
}

std::string inventory_footer() {
    using enum help::block::admonition;

    // clang-format off
    std::vector<help::item> items{
        help::block{none, "List every repository visible to the credentials of an account, and the"},
        help::block{none, "images in each repository with their push date and tags."},
        help::linebreak{},
        help::block{xmpl, "list the images of the build account"},
        help::block{code,   "regsync inventory build us-east-1"},
    };
    // clang-format on

    return help::render(items);
}

} // namespace regsync
