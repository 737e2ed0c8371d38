//
// Created by igor on 19/10/2026.
//
// Unit tests for building the font document and emitting it atomically
//

#include <doctest/doctest.h>
#include <inkfont/errors.hh>
#include <inkfont/font_assembler.hh>
#include <inkfont/utils/work_directory.hh>
#include "test_data.hh"
#include <fstream>

using namespace inkfont;
using namespace inkfont::test;

namespace {
    std::vector<glyph_result> results_for(const character_set& set) {
        const metrics_calculator metrics(spacing_table{}, design_space{});
        std::vector<glyph_result> out;
        for (const auto& spec : set) {
            glyph_result r;
            r.cell_index = spec.cell_index;
            r.codepoint = spec.codepoint;
            if (spec.codepoint == U'A') {
                r.outline.contours.push_back(rect_contour(200, -100, 800, 500, false));
                r.status = glyph_status::inked;
            }
            r.metrics = metrics.measure(r.outline, spec.cls);
            out.push_back(std::move(r));
        }
        return out;
    }

    std::string file_text(const std::filesystem::path& path) {
        const auto bytes = read_file(path);
        return {bytes.begin(), bytes.end()};
    }
}

TEST_SUITE("font_assembler") {

    TEST_CASE("document holds every character plus notdef and space") {
        const auto set = character_set::select({char_class::upper});
        const font_assembler assembler(font_settings{}, design_space{});
        const font_document doc = assembler.assemble(set, results_for(set));

        CHECK(doc.size() == 27);
        CHECK(doc.contains(U' '));
        CHECK(doc.find(U' ')->status == glyph_status::synthetic);
        CHECK(doc.find(U' ')->metrics.advance_width == 500);
        CHECK(doc.notdef().name == ".notdef");
        CHECK(doc.glyph_order().front() == &doc.notdef());
        CHECK(missing_characters(doc, set).empty());

        const glyph_entry* a = doc.find(U'A');
        REQUIRE(a != nullptr);
        CHECK(a->name == "uni0041");
        CHECK(a->status == glyph_status::inked);
        CHECK(a->metrics == glyph_metrics{650, 25, 25});
        CHECK(a->outline.bounds().x_min == 25.0);
        CHECK(a->outline.bounds().x_max == 625.0);

        const glyph_entry* b = doc.find(U'B');
        REQUIRE(b != nullptr);
        CHECK(b->outline.empty());
        CHECK(b->metrics.advance_width == 250);
    }

    TEST_CASE("symbol set gets a synthetic space too") {
        const auto set = character_set::select({char_class::symbol});
        const font_assembler assembler(font_settings{}, design_space{});
        const font_document doc = assembler.assemble(set, results_for(set));
        CHECK(doc.size() == set.size() + 1);
        CHECK(doc.find(U' ')->status == glyph_status::synthetic);
    }

    TEST_CASE("font info comes from the settings") {
        font_settings font;
        font.name = "My Hand";
        font.version = "2.5";
        design_space design;
        design.units_per_em = 2048;
        const font_info info = font_assembler(font, design).info();
        CHECK(info.family == "My Hand");
        CHECK(info.version == "2.5");
        CHECK(info.units_per_em == 2048);
        CHECK(info.postscript_name() == "MyHand-Regular");
    }

    TEST_CASE("missing characters are named") {
        const auto set = character_set::select({char_class::upper});
        auto results = results_for(set);
        results.erase(results.begin() + 1, results.begin() + 3);

        const font_assembler assembler(font_settings{}, design_space{});
        try {
            (void)assembler.assemble(set, results);
            FAIL("expected assembly_error");
        } catch (const assembly_error& e) {
            const std::string what = e.what();
            CHECK(what.find("B (U+0042)") != std::string::npos);
            CHECK(what.find("C (U+0043)") != std::string::npos);
        }
    }

    TEST_CASE("results that do not belong to the set") {
        const auto set = character_set::select({char_class::digit});
        const font_assembler assembler(font_settings{}, design_space{});

        auto extra = results_for(set);
        glyph_result stray;
        stray.codepoint = U'Z';
        extra.push_back(stray);
        CHECK_THROWS_AS((void)assembler.assemble(set, extra), assembly_error);

        auto moved = results_for(set);
        moved[3].cell_index = 4;
        CHECK_THROWS_AS((void)assembler.assemble(set, moved), assembly_error);

        auto twice = results_for(set);
        twice.push_back(twice.front());
        CHECK_THROWS_AS((void)assembler.assemble(set, twice), assembly_error);
    }

    TEST_CASE("notdef is a box with a hole") {
        const glyph_entry notdef = font_assembler(font_settings{}, design_space{}).notdef_glyph();
        REQUIRE(notdef.outline.contours.size() == 2);
        CHECK(signed_area(notdef.outline.contours[0]) < 0.0);
        CHECK(signed_area(notdef.outline.contours[1]) > 0.0);
        CHECK(notdef.metrics == glyph_metrics{500, 50, 50});

        const bbox b = notdef.outline.bounds();
        CHECK(b.x_min == 50.0);
        CHECK(b.x_max == 450.0);
        CHECK(b.y_min == 0.0);
        CHECK(b.y_max == 700.0);
    }

    TEST_CASE("placement moves xMin to the left bearing") {
        glyph_outline o;
        o.contours.push_back(rect_contour(300, 0, 400, 100));
        const glyph_outline placed = place(o, {200, 60, 40});
        CHECK(placed.bounds().x_min == 60.0);
        CHECK(placed.bounds().y_min == 0.0);
        CHECK(place(glyph_outline{}, {200, 60, 40}).empty());
    }

    TEST_CASE("emit renames the finished font into place") {
        const auto set = character_set::select({char_class::digit});
        const font_assembler assembler(font_settings{}, design_space{});
        const font_document doc = assembler.assemble(set, results_for(set));

        work_directory dir;
        const auto output = dir.file("Handwriting", ".ttf");
        const recording_compiler compiler;
        assembler.emit(doc, set, compiler, output);

        CHECK(file_text(output) == "FAKEFONT 11");
        CHECK(compiler.m_glyphs == 11);
        CHECK(compiler.m_compiled_to != output);
        CHECK(compiler.m_compiled_to.parent_path() == dir.path());
        CHECK(entry_count(dir.path()) == 1);

        const auto perms = std::filesystem::status(output).permissions();
        CHECK((perms & std::filesystem::perms::others_read) != std::filesystem::perms::none);
    }

    TEST_CASE("failed compilation leaves the previous font untouched") {
        const auto set = character_set::select({char_class::digit});
        const font_assembler assembler(font_settings{}, design_space{});
        const font_document doc = assembler.assemble(set, results_for(set));

        work_directory dir;
        const auto output = dir.file("Handwriting", ".ttf");
        {
            std::ofstream out(output);
            out << "OLD";
        }

        for (bool std_error : {false, true}) {
            const failing_compiler compiler(std_error);
            CHECK_THROWS_AS(assembler.emit(doc, set, compiler, output), assembly_error);
            CHECK(file_text(output) == "OLD");
            CHECK(entry_count(dir.path()) == 1);
        }
    }

    TEST_CASE("incomplete document is never compiled") {
        const auto set = character_set::select({char_class::digit});
        const font_assembler assembler(font_settings{}, design_space{});
        font_document doc(assembler.info());
        doc.set_notdef(assembler.notdef_glyph());

        work_directory dir;
        const auto output = dir.file("Handwriting", ".ttf");
        const recording_compiler compiler;
        CHECK_THROWS_AS(assembler.emit(doc, set, compiler, output), assembly_error);
        CHECK(compiler.m_glyphs == 0);
        CHECK(entry_count(dir.path()) == 0);
    }

    TEST_CASE("output directory that does not exist") {
        const auto set = character_set::select({char_class::digit});
        const font_assembler assembler(font_settings{}, design_space{});
        const font_document doc = assembler.assemble(set, results_for(set));

        work_directory dir;
        const recording_compiler compiler;
        CHECK_THROWS_AS(assembler.emit(doc, set, compiler, dir.path() / "no" / "such" / "font.ttf"),
                        assembly_error);
    }
}
