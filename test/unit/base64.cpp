#include <string>

#include <catch2/catch_all.hpp>

#include <util/base64.h>

TEST_CASE("base64 decode", "[base64]") {
    // RFC 4648 test vectors
    REQUIRE(util::base64_decode("").value() == "");
    REQUIRE(util::base64_decode("Zg==").value() == "f");
    REQUIRE(util::base64_decode("Zm8=").value() == "fo");
    REQUIRE(util::base64_decode("Zm9v").value() == "foo");
    REQUIRE(util::base64_decode("Zm9vYg==").value() == "foob");
    REQUIRE(util::base64_decode("Zm9vYmE=").value() == "fooba");
    REQUIRE(util::base64_decode("Zm9vYmFy").value() == "foobar");

    // binary data is preserved
    REQUIRE(util::base64_decode("YTpiAGM=").value() ==
            std::string("a:b\0c", 5));

    REQUIRE(!util::base64_decode("Zm9"));
    REQUIRE(!util::base64_decode("Zm9v!!!!"));
    REQUIRE(!util::base64_decode("Z==="));
    REQUIRE(!util::base64_decode("===="));
    REQUIRE(!util::base64_decode("Zg==Zm9v"));
}
