//
// Created by igor on 19/10/2026.
//
// Unit tests for the packed 1-bit cell bitmap
//

#include <doctest/doctest.h>
#include <inkfont/utils/ink_bitmap.hh>
#include <stdexcept>
#include <string>

using namespace inkfont;

TEST_SUITE("ink_bitmap") {

    TEST_CASE("packed layout is MSB first") {
        ink_bitmap bits(10, 2);
        CHECK(bits.stride_bytes() == 2);
        bits.set_pixel(0, 0);
        bits.set_pixel(9, 1);

        CHECK(std::to_integer<int>(bits.row(0)[0]) == 0x80);
        CHECK(std::to_integer<int>(bits.row(1)[1]) == 0x40);
        CHECK(bits.ink_count() == 2);
    }

    TEST_CASE("set and clear") {
        ink_bitmap bits(8, 8);
        bits.set_pixel(3, 4);
        CHECK(bits.pixel(3, 4));
        CHECK(bits.ink_at(3, 4));
        bits.clear_pixel(3, 4);
        CHECK_FALSE(bits.pixel(3, 4));
        CHECK(bits.ink_count() == 0);
    }

    TEST_CASE("ink_at outside the bitmap is paper") {
        ink_bitmap bits(2, 2);
        bits.set_pixel(0, 0);
        CHECK_FALSE(bits.ink_at(-1, 0));
        CHECK_FALSE(bits.ink_at(0, 2));
    }

    TEST_CASE("PBM export") {
        ink_bitmap bits(9, 2);
        bits.set_pixel(8, 0);
        const auto pbm = bits.to_pbm();
        const std::string header = "P4\n9 2\n";
        REQUIRE(pbm.size() == header.size() + 4);
        CHECK(std::string(pbm.begin(), pbm.begin() + static_cast<long>(header.size())) == header);
        CHECK(pbm[header.size()] == 0x00);
        CHECK(pbm[header.size() + 1] == 0x80);
    }

    TEST_CASE("grayscale preview") {
        ink_bitmap bits(3, 1);
        bits.set_pixel(1, 0);
        const gray_image img = bits.to_image();
        CHECK(img.width() == 3);
        CHECK(img.pixel(0, 0) == 255);
        CHECK(img.pixel(1, 0) == 0);
    }

    TEST_CASE("negative size is rejected") {
        CHECK_THROWS_AS(ink_bitmap(-1, 3), std::invalid_argument);
    }
}
