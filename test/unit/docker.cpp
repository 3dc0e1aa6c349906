#include <string>

#include <catch2/catch_all.hpp>

#include <regsync/docker.h>

namespace docker = regsync::docker;

TEST_CASE("classify docker errors", "[docker]") {
    using enum regsync::error_kind;
    auto kind = [](std::string err, regsync::error_kind default_kind,
                   bool timed_out = false) {
        util::subprocess_output out{.returncode = 1,
                                    .err = std::move(err),
                                    .timed_out = timed_out};
        return docker::create_error(out, "test", default_kind).kind;
    };

    REQUIRE(kind("Cannot connect to the Docker daemon at "
                 "unix:///var/run/docker.sock. Is the docker daemon running?",
                 auth) == transfer);
    REQUIRE(kind("Error response from daemon: pull access denied for app, "
                 "repository does not exist or may require 'docker login'",
                 transfer) == auth);
    REQUIRE(kind("no basic auth credentials", transfer) == auth);
    REQUIRE(kind("Error response from daemon: Get https://x/v2/: "
                 "unauthorized: authentication required",
                 transfer) == auth);
    REQUIRE(kind("denied: Your authorization token has expired. Reauthenticate "
                 "and try again.",
                 transfer) == auth);
    REQUIRE(kind("denied: User: arn:aws:iam::1:user/ci is not authorized to "
                 "perform: ecr:InitiateLayerUpload",
                 transfer) == permission_denied);
    REQUIRE(kind("Error response from daemon: manifest for x@sha256:aa not "
                 "found: manifest unknown",
                 transfer) == not_found);
    REQUIRE(kind("Error: No such image: x:v1", transfer) == not_found);
    REQUIRE(kind("net/http: TLS handshake timeout", auth) == transfer);
    REQUIRE(kind("read tcp 10.0.0.1:443: connection reset by peer", transfer) ==
            transfer);
    REQUIRE(kind("something unexpected", auth) == auth);
    REQUIRE(kind("something unexpected", transfer) == transfer);

    // time outs of logins are a registry problem, of pulls and pushes a
    // transfer problem
    REQUIRE(kind("", auth, true) == registry_unavailable);
    REQUIRE(kind("", transfer, true) == transfer);
}

TEST_CASE("manifest requests", "[docker]") {
    const regsync::image_ref by_digest{"1.dkr.ecr.eu-west-1.amazonaws.com",
                                       "team/app", std::nullopt,
                                       "sha256:abcd"};
    REQUIRE(docker::manifest_url(by_digest) ==
            "https://1.dkr.ecr.eu-west-1.amazonaws.com/v2/team/app/manifests/"
            "sha256:abcd");

    const regsync::image_ref by_tag{"registry.test", "app", "v1",
                                    std::nullopt};
    REQUIRE(docker::manifest_url(by_tag) ==
            "https://registry.test/v2/app/manifests/v1");

    REQUIRE(!docker::manifest_accept_headers().empty());
    for (auto& h : docker::manifest_accept_headers()) {
        REQUIRE(h.starts_with("Accept: application/"));
    }

    using enum regsync::error_kind;
    REQUIRE(docker::manifest_status(200, by_digest).value());
    REQUIRE(!docker::manifest_status(404, by_digest).value());
    REQUIRE(docker::manifest_status(401, by_digest).error().kind == auth);
    REQUIRE(docker::manifest_status(403, by_digest).error().kind == auth);
    REQUIRE(docker::manifest_status(500, by_digest).error().kind ==
            registry_unavailable);
    REQUIRE(docker::manifest_status(429, by_digest).error().kind ==
            registry_unavailable);
}

TEST_CASE("image references", "[docker]") {
    const regsync::image_ref digest_ref{"registry.test", "app", std::nullopt,
                                        "sha256:0123456789abcdef0123"};
    REQUIRE(digest_ref.string() == "registry.test/app@sha256:0123456789abcdef0123");

    const regsync::image_ref tag_ref{"registry.test", "team/app", "v1.2",
                                     std::nullopt};
    REQUIRE(tag_ref.string() == "registry.test/team/app:v1.2");

    REQUIRE(regsync::untagged_tag("sha256:0123456789abcdef0123") ==
            "untagged-0123456789ab");
    REQUIRE(regsync::short_digest("sha256:0123456789abcdef0123", 4) == "0123");
}
