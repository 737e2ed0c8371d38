//
// Created by igor on 19/10/2026.
//
// Unit tests for mapping traced paths into font design space
//

#include <doctest/doctest.h>
#include <inkfont/glyph_normalizer.hh>
#include <inkfont/tracing/pixel_edge_tracer.hh>
#include <inkfont/tracing/vectorization_adapter.hh>
#include "test_data.hh"
#include <cmath>
#include <optional>

using namespace inkfont;
using namespace inkfont::test;

namespace {
    // 150px square drawn in the middle of a 184px cell interior, baseline at row 142.
    raw_path square_path() {
        raw_path path;
        path.width = 184;
        path.height = 184;
        path.contours.push_back(rect_contour(17, 17, 167, 167));
        return path;
    }

    const cell_frame FRAME{1.0, 142.0};
}

TEST_SUITE("glyph_normalizer") {

    TEST_CASE("upper case square lands on the center line") {
        const glyph_normalizer normalizer(scale_config{}, design_space{});
        const glyph_outline out = normalizer.normalize(square_path(), FRAME, char_class::upper);

        REQUIRE(out.contours.size() == 1);
        const bbox b = out.bounds();
        CHECK(b.x_min == 200.0);
        CHECK(b.x_max == 800.0);
        CHECK(b.y_min == -100.0);
        CHECK(b.y_max == 500.0);
        CHECK(b.center().x == 500.0);
    }

    TEST_CASE("outer contours are clockwise in font space") {
        const glyph_normalizer normalizer(scale_config{}, design_space{});
        raw_path path = square_path();
        path.contours.push_back(rect_contour(50, 50, 100, 100, false));

        const glyph_outline out = normalizer.normalize(normalize_winding(path), FRAME, char_class::upper);
        REQUIRE(out.contours.size() == 2);
        CHECK(signed_area(out.contours[0]) < 0.0);
        CHECK(signed_area(out.contours[1]) > 0.0);
    }

    TEST_CASE("class scale and resolution") {
        const glyph_normalizer normalizer(scale_config{}, design_space{});
        CHECK(normalizer.unit_scale(char_class::upper, 1.0) == doctest::Approx(4.0));
        CHECK(normalizer.unit_scale(char_class::lower, 2.0) == doctest::Approx(1.4));

        const glyph_outline lower = normalizer.normalize(square_path(), FRAME, char_class::lower);
        CHECK(lower.bounds().width() == doctest::Approx(420.0));

        // The same drawing scanned at twice the resolution keeps its size.
        raw_path big;
        big.contours.push_back(rect_contour(34, 34, 334, 334));
        const glyph_outline scanned = normalizer.normalize(big, cell_frame{2.0, 284.0}, char_class::upper);
        CHECK(scanned.bounds().width() == doctest::Approx(600.0));
        CHECK(scanned.bounds().y_min == doctest::Approx(-100.0));
    }

    TEST_CASE("vertical offset and design settings") {
        scale_config scales;
        scales.set(char_class::digit, {2.0, 30.0});
        design_space design;
        design.pixels_per_unit = 2.0;
        design.center_line = 300.0;

        const glyph_normalizer normalizer(scales, design);
        const glyph_outline out = normalizer.normalize(square_path(), FRAME, char_class::digit);
        const bbox b = out.bounds();
        CHECK(b.width() == doctest::Approx(150.0));
        CHECK(b.center().x == doctest::Approx(300.0));
        CHECK(b.y_min == doctest::Approx(-25.0 + 30.0));
    }

    TEST_CASE("a character override replaces its class settings") {
        const auto set = character_set::select({char_class::lower});
        const character_spec& f = *set.find(U'f');
        const character_spec& g = *set.find(U'g');
        const character_spec& a = *set.find(U'a');

        scale_config scales;
        scales.set_override(U'g', {std::nullopt, -150.0});
        scales.set_override(U'f', {4.0, std::nullopt});
        const glyph_normalizer normalizer(scales, design_space{});

        CHECK(normalizer.unit_scale(f, 1.0) == doctest::Approx(4.0));
        CHECK(normalizer.unit_scale(g, 1.0) == doctest::Approx(2.8));
        CHECK(normalizer.unit_scale(a, 2.0) == doctest::Approx(1.4));

        // 'a' falls back to the class: same outline as the class overload.
        CHECK(normalizer.normalize(square_path(), FRAME, a) ==
              normalizer.normalize(square_path(), FRAME, char_class::lower));

        const bbox fb = normalizer.normalize(square_path(), FRAME, f).bounds();
        CHECK(fb.width() == doctest::Approx(600.0));
        CHECK(fb.y_min == doctest::Approx(-100.0));

        const bbox ab = normalizer.normalize(square_path(), FRAME, a).bounds();
        const bbox gb = normalizer.normalize(square_path(), FRAME, g).bounds();
        CHECK(gb.width() == doctest::Approx(ab.width()));
        CHECK(gb.y_min == doctest::Approx(ab.y_min - 150.0));
        CHECK(gb.center().x == doctest::Approx(500.0));
    }

    TEST_CASE("curved glyphs are centred on their ink, not their control points") {
        // Flat right side at x = 100, a bulge to the left that reaches x = -20
        // while its control points sit at x = -40.
        raw_path path;
        contour c;
        c.start = {40, 100};
        c.segments = {segment::cubic_to({-40, 100}, {-40, 0}, {40, 0}),
                      segment::line_to({100, 0}),
                      segment::line_to({100, 100})};
        path.contours.push_back(c);

        const glyph_normalizer normalizer(scale_config{}, design_space{});
        const glyph_outline out = normalizer.normalize(path, FRAME, char_class::upper);
        REQUIRE(out.contours.size() == 1);
        // Ink spans -20..100 and is centred at 40: 100 maps to 500 + 60 * 4.
        CHECK(out.bounds().x_max == 740.0);
        CHECK(curve_bounds(out.contours).center().x == doctest::Approx(500.0));
    }

    TEST_CASE("coordinates are integral") {
        const glyph_normalizer normalizer(scale_config{}, design_space{});
        raw_path path;
        path.contours.push_back(rect_contour(10.3, 20.7, 60.1, 90.9));
        const glyph_outline out = normalizer.normalize(path, FRAME, char_class::symbol);
        for (const auto& c : out.contours) {
            CHECK(c.start.x == std::round(c.start.x));
            for (const auto& s : c.segments) {
                CHECK(s.to.x == std::round(s.to.x));
                CHECK(s.to.y == std::round(s.to.y));
            }
        }
    }

    TEST_CASE("normalizing twice gives the same outline") {
        const glyph_normalizer normalizer(scale_config{}, design_space{});
        const raw_path path = square_path();
        CHECK(normalizer.normalize(path, FRAME, char_class::upper) ==
              normalizer.normalize(path, FRAME, char_class::upper));
    }

    TEST_CASE("empty path gives an empty outline") {
        const glyph_normalizer normalizer(scale_config{}, design_space{});
        CHECK(normalizer.normalize(raw_path{}, FRAME, char_class::upper).empty());
    }

    TEST_CASE("contours that collapse when rounded are dropped") {
        scale_config scales;
        scales.set(char_class::symbol, {0.01, 0.0});
        const glyph_normalizer normalizer(scales, design_space{});

        raw_path path = square_path();
        path.contours.push_back(rect_contour(0, 0, 3, 3));
        const glyph_outline out = normalizer.normalize(path, FRAME, char_class::symbol);
        CHECK(out.contours.size() == 1);
    }

    TEST_CASE("translation helper") {
        glyph_outline o;
        o.contours.push_back(rect_contour(0, 0, 10, 10));
        const glyph_outline moved = translated(o, 5, -2);
        CHECK(moved.bounds().x_min == 5.0);
        CHECK(moved.bounds().y_min == -2.0);
    }

    TEST_CASE("flip mirrors the y axis") {
        CHECK(flip_to_font_space().apply({3, 4}) == point{3, -4});
    }
}
