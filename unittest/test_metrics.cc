//
// Created by igor on 19/10/2026.
//
// Unit tests for advance width and side bearings
//

#include <doctest/doctest.h>
#include <inkfont/metrics.hh>
#include "test_data.hh"

using namespace inkfont;
using namespace inkfont::test;

namespace {
    glyph_outline box(double x0, double x1) {
        glyph_outline o;
        o.contours.push_back(rect_contour(x0, 0, x1, 500));
        return o;
    }

    void check_invariant(const glyph_metrics& m, const glyph_outline& o) {
        CHECK(m.advance_width == m.left_bearing + ink_width(o) + m.right_bearing);
    }
}

TEST_SUITE("metrics") {

    TEST_CASE("ink width") {
        CHECK(ink_width(box(200, 800)) == 600);
        CHECK(ink_width(glyph_outline{}) == 0);
    }

    TEST_CASE("proportional spacing adds the class bearings") {
        spacing_table spacing;
        spacing.entries[static_cast<std::size_t>(char_class::upper)] = {40, 30, 250};
        const metrics_calculator calc(spacing, design_space{});

        const glyph_outline o = box(200, 800);
        const glyph_metrics m = calc.measure(o, char_class::upper);
        CHECK(m.left_bearing == 40);
        CHECK(m.right_bearing == 30);
        CHECK(m.advance_width == 670);
        check_invariant(m, o);

        const glyph_metrics lower = calc.measure(o, char_class::lower);
        CHECK(lower == glyph_metrics{650, 25, 25});
    }

    TEST_CASE("empty glyph gets the minimum advance") {
        const metrics_calculator calc(spacing_table{}, design_space{});
        const glyph_metrics m = calc.measure(glyph_outline{}, char_class::digit);
        CHECK(m.advance_width == 250);
        CHECK(m.left_bearing == 25);
        CHECK(m.right_bearing == 225);
        check_invariant(m, glyph_outline{});
    }

    TEST_CASE("empty glyph never gets less than its bearings") {
        spacing_table spacing;
        spacing.entries[static_cast<std::size_t>(char_class::symbol)] = {200, 150, 100};
        const metrics_calculator calc(spacing, design_space{});
        CHECK(calc.measure(glyph_outline{}, char_class::symbol).advance_width == 350);
    }

    TEST_CASE("monospace centers the advance on the center line") {
        spacing_table spacing;
        spacing.mode = spacing_mode::monospace;
        spacing.monospace_advance = 700;
        const metrics_calculator calc(spacing, design_space{});

        const glyph_outline wide = box(200, 800);
        const glyph_metrics m = calc.measure(wide, char_class::upper);
        CHECK(m.advance_width == 700);
        CHECK(m.left_bearing == 50);
        CHECK(m.right_bearing == 50);
        check_invariant(m, wide);

        const glyph_outline narrow = box(450, 550);
        const glyph_metrics n = calc.measure(narrow, char_class::lower);
        CHECK(n.advance_width == 700);
        CHECK(n.left_bearing == 300);
        check_invariant(n, narrow);

        const glyph_metrics e = calc.measure(glyph_outline{}, char_class::digit);
        CHECK(e.advance_width == 700);
        check_invariant(e, glyph_outline{});
    }

    TEST_CASE("glyph wider than the monospace advance overhangs") {
        spacing_table spacing;
        spacing.mode = spacing_mode::monospace;
        spacing.monospace_advance = 400;
        const metrics_calculator calc(spacing, design_space{});

        const glyph_outline o = box(200, 800);
        const glyph_metrics m = calc.measure(o, char_class::upper);
        CHECK(m.left_bearing < 0);
        CHECK(m.right_bearing < 0);
        check_invariant(m, o);
    }

    TEST_CASE("advance out of range") {
        const metrics_calculator calc(spacing_table{}, design_space{});
        CHECK_THROWS_AS((void)calc.measure(box(0, 70000), char_class::upper), std::out_of_range);
    }
}
