/**
 * @file id_codec_test.cpp
 * @brief Unit tests for numeric_id_codec
 */

#include <catch2/catch_test_macros.hpp>

#include <checkin/core/id_codec.hpp>

using namespace checkin::core;

TEST_CASE("numeric_id_codec encodes keys as decimal text", "[id_codec]") {
    numeric_id_codec codec;

    CHECK(codec.encode(1) == "1");
    CHECK(codec.encode(9876543210) == "9876543210");
}

TEST_CASE("numeric_id_codec decodes what it encodes", "[id_codec]") {
    numeric_id_codec codec;

    auto decoded = codec.decode(codec.encode(42));
    REQUIRE(decoded.has_value());
    CHECK(*decoded == 42);
}

TEST_CASE("numeric_id_codec rejects malformed identifiers", "[id_codec][invalid]") {
    numeric_id_codec codec;

    SECTION("empty") { CHECK_FALSE(codec.decode("").has_value()); }
    SECTION("letters") { CHECK_FALSE(codec.decode("abc").has_value()); }
    SECTION("trailing characters") { CHECK_FALSE(codec.decode("12x").has_value()); }
    SECTION("leading space") { CHECK_FALSE(codec.decode(" 12").has_value()); }
    SECTION("zero") { CHECK_FALSE(codec.decode("0").has_value()); }
    SECTION("negative") { CHECK_FALSE(codec.decode("-5").has_value()); }
    SECTION("overflow") {
        CHECK_FALSE(codec.decode("99999999999999999999999").has_value());
    }
}
