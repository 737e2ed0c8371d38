//
// Created by igor on 19/10/2026.
//
// Unit tests for the SFD export and the external fontforge backend
//

#include <doctest/doctest.h>
#include <inkfont/compile/fontforge_compiler.hh>
#include <inkfont/errors.hh>
#include <inkfont/font_assembler.hh>
#include <inkfont/utils/work_directory.hh>
#include "test_data.hh"
#include <algorithm>

using namespace inkfont;
using namespace inkfont::test;

namespace {
    font_document sample_document() {
        font_settings font;
        font.name = "Test Hand";
        const font_assembler assembler(font, design_space{});
        font_document doc(assembler.info());
        doc.set_notdef(assembler.notdef_glyph());

        glyph_entry a;
        a.codepoint = U'A';
        a.outline.contours.push_back(rect_contour(25, -100, 625, 500, false));
        a.metrics = {650, 25, 25};
        doc.add(a);

        glyph_entry q;
        q.codepoint = U'q';
        q.outline.contours.push_back({{0, 0}, {segment::quad_to({150, 300}, {300, 0})}});
        q.metrics = {350, 25, 25};
        doc.add(q);

        doc.add(assembler.space_glyph());
        return doc;
    }

    std::size_t occurrences(const std::string& text, const std::string& what) {
        std::size_t n = 0;
        for (auto pos = text.find(what); pos != std::string::npos; pos = text.find(what, pos + 1)) {
            ++n;
        }
        return n;
    }
}

TEST_SUITE("fontforge_compiler") {

    TEST_CASE("SFD header") {
        const std::string sfd = to_sfd(sample_document());
        CHECK(sfd.rfind("SplineFontDB: 3.0\n", 0) == 0);
        CHECK(sfd.find("FontName: TestHand-Regular\n") != std::string::npos);
        CHECK(sfd.find("FamilyName: Test Hand\n") != std::string::npos);
        CHECK(sfd.find("Ascent: 800\n") != std::string::npos);
        CHECK(sfd.find("Descent: 200\n") != std::string::npos);
        CHECK(sfd.find("Encoding: UnicodeBmp\n") != std::string::npos);
        CHECK(sfd.find("BeginChars: 65536 4\n") != std::string::npos);
        CHECK(sfd.find("EndSplineFont\n") != std::string::npos);
    }

    TEST_CASE("one character block per glyph") {
        const std::string sfd = to_sfd(sample_document());
        CHECK(occurrences(sfd, "StartChar: ") == 4);
        CHECK(occurrences(sfd, "EndChar\n") == 4);
        CHECK(sfd.find("StartChar: .notdef\nEncoding: 0 -1 0\n") != std::string::npos);
        CHECK(sfd.find("StartChar: uni0041\nEncoding: 65 65 65\nWidth: 650\n") != std::string::npos);
        CHECK(sfd.find("StartChar: space\nEncoding: 32 32 32\nWidth: 500\n") != std::string::npos);
    }

    TEST_CASE("outlines are written as closed spline sets") {
        const std::string sfd = to_sfd(sample_document());
        // .notdef, A and q have outlines; space has none.
        CHECK(occurrences(sfd, "SplineSet\n") - occurrences(sfd, "EndSplineSet\n") == 3);
        CHECK(occurrences(sfd, " m 1\n") == 4);
        CHECK(occurrences(sfd, " c 0\n") == 1);
    }

    TEST_CASE("command line") {
        compiler_settings settings;
        settings.executable = "/opt/fontforge/bin/fontforge";
        const fontforge_compiler compiler(settings);
        CHECK(compiler.name() == "fontforge");

        const auto cmd = compiler.command("in.sfd", "out.ttf");
        REQUIRE(cmd.size() == 6);
        CHECK(cmd[0] == "/opt/fontforge/bin/fontforge");
        CHECK(cmd[1] == "-lang=ff");
        CHECK(cmd[4] == "in.sfd");
        CHECK(cmd[5] == "out.ttf");
    }

    TEST_CASE("factory") {
        compiler_settings settings;
        settings.engine = compiler_kind::fontforge;
        CHECK(make_font_compiler(settings)->name() == "fontforge");
    }

    TEST_CASE("failing executable leaves no output") {
        work_directory dir;
        const auto output = dir.file("font", ".ttf");

        for (const char* exe : {"false", "true", "inkfont-no-such-fontforge"}) {
            compiler_settings settings;
            settings.engine = compiler_kind::fontforge;
            settings.executable = exe;
            const fontforge_compiler compiler(settings);
            CHECK_THROWS_AS(compiler.compile(sample_document(), output), assembly_error);
            CHECK_FALSE(std::filesystem::exists(output));
        }
    }

    TEST_CASE("scratch files go into the job directory") {
        work_directory root;
        work_directory job(root.path());
        job.keep();

        compiler_settings settings;
        settings.engine = compiler_kind::fontforge;
        settings.executable = "true";
        const fontforge_compiler compiler(settings);
        CHECK_THROWS_AS(compiler.compile(sample_document(), root.file("font", ".ttf"), compile_job{&job}),
                        assembly_error);

        CHECK(std::filesystem::exists(job.file("font", ".sfd")));
        CHECK(std::filesystem::exists(job.file("fontforge", ".log")));
        CHECK(entry_count(root.path()) == 1);
    }
}
