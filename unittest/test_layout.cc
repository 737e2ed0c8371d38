//
// Created by igor on 19/10/2026.
//
// Unit tests for character sets and the template grid
//

#include <doctest/doctest.h>
#include <inkfont/errors.hh>
#include <inkfont/layout.hh>
#include <set>
#include <stdexcept>
#include <vector>

using namespace inkfont;

TEST_SUITE("layout") {

    TEST_CASE("standard set covers every class in policy order") {
        const auto set = character_set::standard();
        CHECK(set.size() == 26 + 26 + 10 + 32);
        CHECK(set.at(0).codepoint == U'A');
        CHECK(set.at(0).cls == char_class::upper);
        CHECK(set.at(26).codepoint == U'a');
        CHECK(set.at(52).codepoint == U'0');
        CHECK(set.at(62).cls == char_class::symbol);
    }

    TEST_CASE("cell indices are dense and codepoints unique") {
        const auto set = character_set::standard();
        std::set<char32_t> seen;
        std::size_t i = 0;
        for (const auto& spec : set) {
            CHECK(spec.cell_index == i++);
            CHECK(seen.insert(spec.codepoint).second);
            CHECK(spec.label.size() == 1);
        }
    }

    TEST_CASE("selection keeps policy order regardless of argument order") {
        const auto set = character_set::select({char_class::digit, char_class::upper});
        CHECK(set.size() == 36);
        CHECK(set.at(0).codepoint == U'A');
        CHECK(set.at(26).codepoint == U'0');
        CHECK(set.at(35).cell_index == 35);
    }

    TEST_CASE("empty selection is rejected") {
        CHECK_THROWS_AS(character_set::select(std::vector<char_class>{}), layout_error);
    }

    TEST_CASE("lookup") {
        const auto set = character_set::select({char_class::symbol});
        const auto* amp = set.find(U'&');
        REQUIRE(amp != nullptr);
        CHECK(amp->cls == char_class::symbol);
        CHECK(set.find(U'A') == nullptr);
        CHECK_THROWS_AS((void)set.at(set.size()), std::out_of_range);
    }

    TEST_CASE("class names") {
        CHECK(to_string(char_class::lower) == "lower");
        CHECK(parse_char_class("digit") == char_class::digit);
        CHECK_FALSE(parse_char_class("Digit").has_value());
        CHECK(codepoint_name(U'A') == "U+0041");
        CHECK(codepoint_name(0x1F600) == "U+1F600");
    }

    TEST_CASE("cell rectangles") {
        grid_layout grid;
        grid.rows = 10;
        grid.columns = 10;
        const auto set = character_set::standard();

        CHECK(cell_for(grid, set.at(0)) == cell_rect{20, 20, 200, 200});
        CHECK(cell_for(grid, set.at(11)) == cell_rect{220, 220, 200, 200});
        CHECK(grid.width() == 2040);
        CHECK(grid.height() == 2040);
        CHECK(grid.baseline_offset() == doctest::Approx(150.0));
    }

    TEST_CASE("every cell lies inside the image margins") {
        const std::vector<character_set> sets = {
            character_set::standard(),
            character_set::select({char_class::digit}),
            character_set::select({char_class::lower, char_class::symbol}),
        };

        for (const int columns : {1, 4, 13, 17}) {
            for (const int margin : {0, 10, 20}) {
                for (const int extra_rows : {0, 1, 5}) {
                    for (const auto& set : sets) {
                        grid_layout grid;
                        grid.columns = columns;
                        grid.margin = margin;
                        grid.cell_width = 60 + 7 * columns;
                        grid.cell_height = 90;
                        grid = fit_rows(grid, set);
                        grid.rows += extra_rows;
                        REQUIRE_NOTHROW(validate(grid, set));

                        for (const auto& spec : set) {
                            const cell_rect r = cell_for(grid, spec);
                            CHECK(r.x >= grid.margin);
                            CHECK(r.y >= grid.margin);
                            CHECK(r.x + r.width <= grid.width() - grid.margin);
                            CHECK(r.y + r.height <= grid.height() - grid.margin);
                        }
                    }
                }
            }
        }
    }

    TEST_CASE("cell outside the grid") {
        grid_layout grid;
        grid.rows = 1;
        grid.columns = 2;
        const auto set = character_set::select({char_class::upper});
        CHECK_THROWS_AS((void)cell_for(grid, set.at(2)), layout_error);
    }

    TEST_CASE("fit rows") {
        grid_layout grid;
        grid.columns = 13;
        const auto set = character_set::standard();
        const grid_layout fitted = fit_rows(grid, set);
        CHECK(fitted.rows == 8);
        CHECK(fitted.capacity() >= set.size());

        grid.rows = 3;
        CHECK(fit_rows(grid, set).rows == 3);
    }

    TEST_CASE("validation") {
        const auto set = character_set::standard();
        grid_layout grid;
        grid.rows = 2;
        CHECK_THROWS_AS(validate(grid, set), layout_error);

        grid = fit_rows(grid_layout{}, set);
        CHECK_NOTHROW(validate(grid, set));

        grid.border_thickness = 60;
        grid.safety_margin = 40;
        CHECK_THROWS_AS(validate(grid, set), layout_error);

        grid = fit_rows(grid_layout{}, set);
        grid.baseline_ratio = 0.0;
        CHECK_THROWS_AS(validate(grid, set), layout_error);
    }

    TEST_CASE("scaled coordinates round to nearest") {
        CHECK(scale_coord(10, 1.5) == 15);
        CHECK(scale_coord(3, 0.5) == 2);
        CHECK(scale_rect({20, 20, 200, 200}, 2.0) == cell_rect{40, 40, 400, 400});
    }
}
