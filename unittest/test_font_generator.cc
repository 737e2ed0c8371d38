//
// Created by igor on 19/10/2026.
//
// End-to-end tests of the template to font pipeline
//

#include <doctest/doctest.h>
#include <inkfont/errors.hh>
#include <inkfont/font_generator.hh>
#include <inkfont/ttf_reader.hh>
#include <inkfont/utils/work_directory.hh>
#include "test_data.hh"
#include <optional>

using namespace inkfont;
using namespace inkfont::test;

namespace {
    generator_config grid_10x10() {
        generator_config cfg = default_config();
        cfg.grid.rows = 10;
        cfg.grid.columns = 10;
        cfg.pipeline.workers = 2;
        return cfg;
    }

    const glyph_report& report_for(const generation_result& r, char32_t cp) {
        for (const auto& g : r.glyphs) {
            if (g.codepoint == cp) {
                return g;
            }
        }
        FAIL("no report for " << codepoint_name(cp));
        return r.glyphs.front();
    }
}

TEST_SUITE("font_generator") {

    TEST_CASE("drawn square becomes a 600 unit glyph") {
        const generator_config cfg = grid_10x10();
        const auto set = character_set::select({char_class::upper});
        gray_image img = blank_template(cfg.grid, set);
        draw_square(img, cfg.grid, set.at(0), 150);

        work_directory dir;
        const auto output = dir.file("Handwriting", ".ttf");
        const font_generator generator(cfg);
        CHECK(generator.tracer().name() == "builtin");
        CHECK(generator.compiler().name() == "truetype");

        const generation_result result = generator.generate(img, set, output);
        CHECK(result.output == output);
        REQUIRE(result.glyphs.size() == 26);
        CHECK(result.count(glyph_status::inked) == 1);
        CHECK(result.count(glyph_status::empty) == 25);
        CHECK(result.count(glyph_status::trace_failed) == 0);
        CHECK(result.glyphs[0].codepoint == U'A');
        CHECK(result.glyphs[0].ink_pixels == 150 * 150);

        const ttf_reader reader = ttf_reader::load(output);
        REQUIRE(reader.is_valid());
        CHECK(reader.family_name() == "Handwriting");

        const auto box = reader.glyph_box(U'A');
        REQUIRE(box);
        CHECK(box->x_max - box->x_min == 600);
        CHECK(box->x_min == 25);
        CHECK(box->y_min == -100);
        CHECK(box->y_max == 500);
        CHECK(reader.hmetrics(U'A')->advance_width == 650);

        CHECK(reader.has_glyph(U'B'));
        CHECK(reader.contour_count(U'B') == 0);
        CHECK(reader.hmetrics(U'B')->advance_width == 250);
        CHECK(reader.hmetrics(U' ')->advance_width == 500);
    }

    TEST_CASE("a character override reaches the font") {
        generator_config cfg = grid_10x10();
        cfg.scales.set_override(U'B', {std::nullopt, 50.0});
        const auto set = character_set::select({char_class::upper});
        gray_image img = blank_template(cfg.grid, set);
        draw_square(img, cfg.grid, set.at(0), 150);
        draw_square(img, cfg.grid, set.at(1), 150);

        work_directory dir;
        const auto output = dir.file("Override", ".ttf");
        const font_generator generator(cfg);
        (void)generator.generate(img, set, output);

        const ttf_reader reader = ttf_reader::load(output);
        const auto a = reader.glyph_box(U'A');
        const auto b = reader.glyph_box(U'B');
        REQUIRE(a);
        REQUIRE(b);
        CHECK(a->y_min == -100);
        CHECK(b->y_min == -50);
        CHECK(b->y_max == 550);
        CHECK(b->x_max - b->x_min == a->x_max - a->x_min);
    }

    TEST_CASE("a blank template still gives a complete font") {
        generator_config cfg = small_config();
        const auto set = character_set::select({char_class::digit});
        const gray_image img = blank_template(fit_rows(cfg.grid, set), set);

        work_directory dir;
        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<recording_compiler>());
        const auto result = generator.generate(img, set, dir.file("font", ".ttf"));
        CHECK(result.count(glyph_status::empty) == 10);
        CHECK(dynamic_cast<const box_tracer&>(generator.tracer()).calls() == 0);
        CHECK(dynamic_cast<const recording_compiler&>(generator.compiler()).m_glyphs == 11);
    }

    TEST_CASE("only cells with ink are traced") {
        generator_config cfg = small_config();
        const auto set = character_set::select({char_class::upper});
        const grid_layout grid = fit_rows(cfg.grid, set);
        gray_image img = blank_template(grid, set);
        draw_square(img, grid, set.at(2), 30);
        draw_square(img, grid, set.at(25), 20);
        draw_square(img, grid, set.at(7), 2);  // below min_ink_pixels

        work_directory dir;
        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<recording_compiler>());
        const auto result = generator.generate(img, set, dir.file("font", ".ttf"));

        CHECK(result.count(glyph_status::inked) == 2);
        CHECK(dynamic_cast<const box_tracer&>(generator.tracer()).calls() == 2);
        CHECK(report_for(result, U'C').status == glyph_status::inked);
        CHECK(report_for(result, U'Z').status == glyph_status::inked);
        CHECK(report_for(result, U'H').status == glyph_status::empty);
        CHECK(report_for(result, U'H').ink_pixels == 4);
    }

    TEST_CASE("tracing failures keep the font going") {
        generator_config cfg = small_config();
        const auto set = character_set::select({char_class::digit});
        const grid_layout grid = fit_rows(cfg.grid, set);
        gray_image img = blank_template(grid, set);
        draw_square(img, grid, set.at(4), 30);

        work_directory dir;
        const auto output = dir.file("font", ".ttf");
        const font_generator generator(cfg, std::make_unique<failing_tracer>(),
                                       std::make_unique<recording_compiler>());
        const auto result = generator.generate(img, set, output);

        const glyph_report& four = report_for(result, U'4');
        CHECK(four.status == glyph_status::trace_failed);
        CHECK(four.failure.find(cell_stem(set.at(4))) != std::string::npos);
        CHECK(result.count(glyph_status::empty) == 9);
        CHECK(std::filesystem::exists(output));
    }

    TEST_CASE("compiler failure leaves the output untouched") {
        generator_config cfg = small_config();
        const auto set = character_set::select({char_class::digit});
        const gray_image img = blank_template(fit_rows(cfg.grid, set), set);

        work_directory dir;
        const auto output = dir.file("font", ".ttf");
        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<failing_compiler>());
        CHECK_THROWS_AS((void)generator.generate(img, set, output), assembly_error);
        CHECK_FALSE(std::filesystem::exists(output));
        CHECK(entry_count(dir.path()) == 0);
    }

    TEST_CASE("cancellation writes nothing") {
        generator_config cfg = small_config();
        const auto set = character_set::select({char_class::digit});
        const gray_image img = blank_template(fit_rows(cfg.grid, set), set);

        work_directory dir;
        const auto output = dir.file("font", ".ttf");
        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<recording_compiler>());
        cancellation_token cancel;
        cancel.cancel();
        CHECK_THROWS_AS((void)generator.generate(img, set, output, cancel), cancelled_error);
        CHECK_FALSE(std::filesystem::exists(output));
        CHECK(dynamic_cast<const recording_compiler&>(generator.compiler()).m_glyphs == 0);
    }

    TEST_CASE("layout errors come before the image is read") {
        generator_config cfg = small_config();
        cfg.grid.rows = 1;
        const auto set = character_set::select({char_class::upper});

        work_directory dir;
        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<recording_compiler>());
        CHECK_THROWS_AS((void)generator.generate(dir.file("missing", ".png"), set, dir.file("font", ".ttf")),
                        layout_error);
    }

    TEST_CASE("unreadable or mismatched source") {
        const generator_config cfg = small_config();
        const auto set = character_set::select({char_class::digit});

        work_directory dir;
        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<recording_compiler>());
        CHECK_THROWS_AS((void)generator.generate(dir.file("missing", ".png"), set, dir.file("font", ".ttf")),
                        extraction_error);
        CHECK_THROWS_AS((void)generator.generate(gray_image(50, 50), set, dir.file("font", ".ttf")),
                        extraction_error);
    }

    TEST_CASE("intermediates are kept on request") {
        work_directory root;
        generator_config cfg = small_config();
        cfg.pipeline.work_root = root.path();
        cfg.pipeline.keep_intermediates = true;

        const auto set = character_set::select({char_class::upper});
        const grid_layout grid = fit_rows(cfg.grid, set);
        gray_image img = blank_template(grid, set);
        draw_square(img, grid, set.at(0), 30);

        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<recording_compiler>());
        (void)generator.generate(img, set, root.file("font", ".ttf"));

        std::filesystem::path job;
        for (const auto& entry : std::filesystem::directory_iterator(root.path())) {
            if (entry.is_directory()) {
                job = entry.path();
            }
        }
        REQUIRE_FALSE(job.empty());
        CHECK(std::filesystem::exists(job / "cell_000_U+0041.png"));
        CHECK_FALSE(std::filesystem::exists(job / "cell_001_U+0042.png"));
    }

    TEST_CASE("job directory is removed by default") {
        work_directory root;
        generator_config cfg = small_config();
        cfg.pipeline.work_root = root.path();
        const auto set = character_set::select({char_class::digit});
        const gray_image img = blank_template(fit_rows(cfg.grid, set), set);

        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<recording_compiler>());
        (void)generator.generate(img, set, root.file("font", ".ttf"));
        CHECK(entry_count(root.path()) == 1);
    }

    TEST_CASE("compiler works inside the job directory") {
        work_directory root;
        generator_config cfg = small_config();
        cfg.pipeline.work_root = root.path();
        const auto set = character_set::select({char_class::digit});
        const gray_image img = blank_template(fit_rows(cfg.grid, set), set);

        const font_generator generator(cfg, std::make_unique<box_tracer>(), std::make_unique<recording_compiler>());
        (void)generator.generate(img, set, root.file("font", ".ttf"));

        const auto& compiler = dynamic_cast<const recording_compiler&>(generator.compiler());
        REQUIRE_FALSE(compiler.m_work_dir.empty());
        CHECK(compiler.m_work_dir.parent_path() == root.path());
    }

    TEST_CASE("template files") {
        generator_config cfg = small_config();
        cfg.templ.label_font = "/nonexistent/label.ttf";
        const auto set = character_set::select({char_class::digit});
        const font_generator generator(cfg);

        work_directory dir;
        generator.write_template(set, dir.file("t", ".svg"), dir.file("t", ".png"));
        CHECK(std::filesystem::file_size(dir.file("t", ".svg")) > 0);
        const gray_image png = gray_image::load(dir.file("t", ".png"));
        CHECK(png.width() == fit_rows(cfg.grid, set).width());

        generator.write_template(set, {}, dir.file("only", ".png"));
        CHECK(std::filesystem::exists(dir.file("only", ".png")));
        CHECK(entry_count(dir.path()) == 3);
    }

    TEST_CASE("rendered template round trip") {
        for (const double scale : {1.0, 2.0, 4.0}) {
            CAPTURE(scale);
            generator_config cfg = small_config();
            cfg.templ.raster_scale = scale;
            const auto set = character_set::select({char_class::lower});
            const grid_layout grid = fit_rows(cfg.grid, set);
            const font_generator generator(cfg, std::make_unique<box_tracer>(),
                                           std::make_unique<recording_compiler>());

            work_directory dir;
            generator.write_template(set, {}, dir.file("t", ".png"));
            const auto blank = generator.generate(dir.file("t", ".png"), set, dir.file("blank", ".ttf"));
            CHECK(blank.count(glyph_status::empty) == set.size());

            gray_image filled = gray_image::load(dir.file("t", ".png"));
            CHECK(filled.width() == scale_coord(grid.width(), scale));
            draw_square(filled, grid, set.at(6), 30, scale);
            const auto result = generator.generate(filled, set, dir.file("font", ".ttf"));
            CHECK(result.count(glyph_status::inked) == 1);
            CHECK(report_for(result, U'g').status == glyph_status::inked);
            CHECK(report_for(result, U'g').ink_pixels == static_cast<std::size_t>(900 * scale * scale));
        }
    }

    TEST_CASE("cell file stems") {
        const auto set = character_set::select({char_class::upper});
        CHECK(cell_stem(set.at(4)) == "cell_004_U+0045");
    }

    TEST_CASE("invalid configuration") {
        generator_config cfg = small_config();
        cfg.extraction.threshold = 0;
        CHECK_THROWS_AS(font_generator{cfg}, config_error);
        CHECK_THROWS(font_generator(small_config(), nullptr, std::make_unique<recording_compiler>()));
    }
}
