//
// Created by igor on 19/10/2026.
//
// Unit tests for the tracer-independent cleanup of traced paths
//

#include <doctest/doctest.h>
#include <inkfont/tracing/vectorization_adapter.hh>
#include "test_data.hh"

using namespace inkfont;
using namespace inkfont::test;

TEST_SUITE("vectorization_adapter") {

    TEST_CASE("outer loops become positive and holes negative") {
        raw_path path;
        path.contours.push_back(rect_contour(0, 0, 100, 100, false));  // outer, wrong way round
        path.contours.push_back(rect_contour(20, 20, 80, 80, true));   // hole, wrong way round
        path.contours.push_back(rect_contour(40, 40, 60, 60, false));  // island inside the hole

        CHECK(nesting_depth(path, 0) == 0);
        CHECK(nesting_depth(path, 1) == 1);
        CHECK(nesting_depth(path, 2) == 2);

        const raw_path fixed = normalize_winding(path);
        CHECK(signed_area(fixed.contours[0]) > 0.0);
        CHECK(signed_area(fixed.contours[1]) < 0.0);
        CHECK(signed_area(fixed.contours[2]) > 0.0);
    }

    TEST_CASE("correct winding is left alone") {
        raw_path path;
        path.contours.push_back(rect_contour(0, 0, 10, 10, true));
        path.contours.push_back(rect_contour(2, 2, 8, 8, false));
        const raw_path fixed = normalize_winding(path);
        CHECK(fixed.contours[0] == path.contours[0]);
        CHECK(fixed.contours[1] == path.contours[1]);
    }

    TEST_CASE("degenerate contours are dropped") {
        raw_path path;
        path.contours.push_back(rect_contour(0, 0, 10, 10));

        contour line;
        line.start = {0, 0};
        line.segments = {segment::line_to({5, 5}), segment::line_to({0, 0})};
        path.contours.push_back(line);

        contour dot;
        dot.start = {3, 3};
        path.contours.push_back(dot);

        path.contours.push_back(rect_contour(0, 0, 0.5, 0.5));

        const raw_path clean = strip_degenerate(path);
        REQUIRE(clean.contours.size() == 1);
        CHECK(clean.contours[0] == path.contours[0]);
    }

    TEST_CASE("vectorize cleans the engine output") {
        raw_path traced;
        traced.width = 50;
        traced.height = 50;
        traced.contours.push_back(rect_contour(5, 5, 45, 45, false));
        traced.contours.push_back(rect_contour(1, 1, 1.2, 1.2));

        const fixed_tracer engine(traced);
        const vectorization_adapter adapter(engine);
        CHECK(&adapter.engine() == &engine);

        ink_bitmap bits(50, 50);
        bits.set_pixel(10, 10);
        const vectorized v = adapter.vectorize(bits, trace_job{});
        CHECK_FALSE(v.failed);
        REQUIRE(v.path.contours.size() == 1);
        CHECK(signed_area(v.path.contours[0]) == doctest::Approx(1600.0));
    }

    TEST_CASE("engine failure is reported, not thrown") {
        const failing_tracer engine;
        ink_bitmap bits(12, 7);
        bits.set_pixel(3, 3);

        const vectorized v = vectorization_adapter(engine).vectorize(bits, trace_job{nullptr, "cell_000_U+0041"});
        CHECK(v.failed);
        CHECK(v.failure.find("cell_000_U+0041") != std::string::npos);
        CHECK(v.path.empty());
        CHECK(v.path.width == 12);
        CHECK(v.path.height == 7);
    }
}
