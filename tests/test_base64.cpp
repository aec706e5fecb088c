#include <catch2/catch_test_macros.hpp>

#include "voice_relay/utils/base64.hpp"

#include <stdexcept>
#include <string>

using voice_relay::utils::base64_decode;
using voice_relay::utils::base64_encode;

TEST_CASE("base64_encode pads short tails") {
    REQUIRE(base64_encode("") == "");
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64_decode reverses padded input") {
    REQUIRE(base64_decode("Zg==") == "f");
    REQUIRE(base64_decode("Zm8=") == "fo");
    REQUIRE(base64_decode("AAAA") == std::string(3, '\0'));
}

TEST_CASE("audio payload survives decode and re-encode unchanged") {
    std::string audio;
    for (int i = 0; i < 256; ++i) {
        audio.push_back(static_cast<char>(i));
    }
    const auto encoded = base64_encode(audio);
    REQUIRE(base64_decode(encoded) == audio);
    REQUIRE(base64_encode(base64_decode(encoded)) == encoded);
}

TEST_CASE("base64_decode rejects malformed input") {
    REQUIRE_THROWS_AS(base64_decode("abc"), std::invalid_argument);
    REQUIRE_THROWS_AS(base64_decode("ab!d"), std::invalid_argument);
    REQUIRE_THROWS_AS(base64_decode("A=AA"), std::invalid_argument);
    REQUIRE_THROWS_AS(base64_decode("AA=A"), std::invalid_argument);
    REQUIRE_THROWS_AS(base64_decode("AA==AAAA"), std::invalid_argument);
}
