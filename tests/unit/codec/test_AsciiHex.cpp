#include <labelbridge/codec/AsciiHex.hpp>

#include <doctest/doctest.h>

#include <string>

using namespace LB;
using namespace LB::Codec;

TEST_SUITE("codec.ascii_hex") {
    TEST_CASE("compression tokens map to repeat counts") {
        CHECK(compressionCount('G') == 1);
        CHECK(compressionCount('I') == 3);
        CHECK(compressionCount('Y') == 19);
        CHECK(compressionCount('g') == 20);
        CHECK(compressionCount('h') == 40);
        CHECK(compressionCount('y') == 380);

        CHECK_FALSE(compressionCount('F').has_value());
        CHECK_FALSE(compressionCount('Z').has_value());
        CHECK_FALSE(compressionCount('z').has_value());
        CHECK_FALSE(compressionCount('0').has_value());
        CHECK_FALSE(compressionCount(',').has_value());
    }

    TEST_CASE("decompress expands token and literal pairs") {
        auto out = decompress("IF");
        REQUIRE(out.has_value());
        CHECK(*out == "FFF");

        auto mixed = decompress("A0IF1");
        REQUIRE(mixed.has_value());
        CHECK(*mixed == "A0FFF1");

        auto lower = decompress("g0");
        REQUIRE(lower.has_value());
        CHECK(*lower == std::string(20, '0'));

        auto big = decompress("y0");
        REQUIRE(big.has_value());
        CHECK(big->size() == 380);
    }

    TEST_CASE("output length is the sum of the repeat counts") {
        auto out = decompress("G0H1");
        REQUIRE(out.has_value());
        CHECK(*out == "011");

        auto lower = decompress("gcG0");
        REQUIRE(lower.has_value());
        CHECK(lower->size() == 21);
        CHECK(*lower == std::string(20, 'C') + "0");
    }

    TEST_CASE("plain hex passes through upper-cased") {
        auto out = decompress("00ff80");
        REQUIRE(out.has_value());
        CHECK(*out == "00FF80");

        auto empty = decompress("");
        REQUIRE(empty.has_value());
        CHECK(empty->empty());
    }

    TEST_CASE("a repeated token literal is not itself a token") {
        // "GG" repeats the letter G once.
        auto out = decompress("GGA");
        REQUIRE(out.has_value());
        CHECK(*out == "GA");
    }

    TEST_CASE("dangling token is malformed") {
        auto out = decompress("00I");
        REQUIRE_FALSE(out.has_value());
        CHECK(out.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("stripLineBreaks joins split payloads") {
        CHECK(stripLineBreaks("00FF\r\nIF\n80") == "00FFIF80");
        CHECK(stripLineBreaks("") == "");
    }
}
