//
// Created by igor on 19/10/2026.
//
// Unit tests for UTF-8 decoding and UTF-16BE encoding of name strings
//

#include <doctest/doctest.h>
#include <inkfont/utils/utf8.hh>
#include <vector>

using namespace inkfont;

TEST_SUITE("utf8") {

    TEST_CASE("decode ASCII") {
        auto [cp, len] = utf8_decode_one("Hello");
        CHECK(cp == 'H');
        CHECK(len == 1);
    }

    TEST_CASE("decode multi-byte sequences") {
        auto [cp2, len2] = utf8_decode_one("\xC3\xA9");
        CHECK(cp2 == 0x00E9);
        CHECK(len2 == 2);

        auto [cp3, len3] = utf8_decode_one("\xE2\x82\xAC");
        CHECK(cp3 == 0x20AC);
        CHECK(len3 == 3);

        auto [cp4, len4] = utf8_decode_one("\xF0\x9F\x98\x80");
        CHECK(cp4 == 0x1F600);
        CHECK(len4 == 4);
    }

    TEST_CASE("invalid input yields the replacement character") {
        auto [cp, len] = utf8_decode_one("\x80");
        CHECK(cp == 0xFFFD);
        CHECK(len == 1);

        auto [cp2, len2] = utf8_decode_one("\xE2\x82");
        CHECK(cp2 == 0xFFFD);
        CHECK(len2 >= 1);
    }

    TEST_CASE("empty input") {
        auto [cp, len] = utf8_decode_one("");
        CHECK(len == 0);
        CHECK(cp == 0xFFFD);
    }

    TEST_CASE("UTF-16BE encoding") {
        CHECK(to_utf16be("Ab") == std::vector<uint8_t>{0x00, 'A', 0x00, 'b'});
        CHECK(to_utf16be("\xC3\xA9") == std::vector<uint8_t>{0x00, 0xE9});
        CHECK(to_utf16be("\xF0\x9F\x98\x80") == std::vector<uint8_t>{0xD8, 0x3D, 0xDE, 0x00});
        CHECK(to_utf16be("").empty());
    }
}
