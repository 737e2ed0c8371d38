//
// Created by igor on 19/10/2026.
//

#include <inkfont/compile/fontforge_compiler.hh>
#include <inkfont/errors.hh>
#include <inkfont/utils/process.hh>
#include <inkfont/utils/work_directory.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <fstream>
#include <memory>
#include <sstream>

namespace inkfont {
    namespace {
        void write_point(std::ostream& os, point p) {
            os << p.x << ' ' << p.y;
        }

        // Quadratic (p0, q, p1) as the equivalent cubic control points.
        std::pair<point, point> raise_quadratic(point p0, point q, point p1) {
            return {
                {p0.x + 2.0 / 3.0 * (q.x - p0.x), p0.y + 2.0 / 3.0 * (q.y - p0.y)},
                {p1.x + 2.0 / 3.0 * (q.x - p1.x), p1.y + 2.0 / 3.0 * (q.y - p1.y)}
            };
        }

        void write_contour(std::ostream& os, const contour& c) {
            write_point(os, c.start);
            os << " m 1\n";
            point cur = c.start;
            for (const auto& s : c.segments) {
                switch (s.kind) {
                    case segment_kind::line:
                        os << ' ';
                        write_point(os, s.to);
                        os << " l 1\n";
                        break;
                    case segment_kind::quadratic: {
                        const auto [a, b] = raise_quadratic(cur, s.c1, s.to);
                        os << ' ';
                        write_point(os, a);
                        os << ' ';
                        write_point(os, b);
                        os << ' ';
                        write_point(os, s.to);
                        os << " c 0\n";
                        break;
                    }
                    case segment_kind::cubic:
                        os << ' ';
                        write_point(os, s.c1);
                        os << ' ';
                        write_point(os, s.c2);
                        os << ' ';
                        write_point(os, s.to);
                        os << " c 0\n";
                        break;
                }
                cur = s.to;
            }
            // SFD contours are closed by returning to the start point.
            if (!(cur == c.start)) {
                os << ' ';
                write_point(os, c.start);
                os << " l 1\n";
            }
        }

        void write_glyph(std::ostream& os, const glyph_entry& entry, int encoding, int unicode) {
            os << "StartChar: " << entry.name << '\n';
            os << "Encoding: " << encoding << ' ' << unicode << ' ' << encoding << '\n';
            os << "Width: " << entry.metrics.advance_width << '\n';
            os << "Flags: W\n";
            os << "LayerCount: 2\n";
            if (!entry.outline.empty()) {
                os << "Fore\n";
                os << "SplineSet\n";
                for (const auto& c : entry.outline.contours) {
                    write_contour(os, reversed(c));
                }
                os << "EndSplineSet\n";
            }
            os << "EndChar\n\n";
        }
    }

    std::string to_sfd(const font_document& doc) {
        const font_info& info = doc.info();
        std::ostringstream os;
        os << "SplineFontDB: 3.0\n";
        os << "FontName: " << info.postscript_name() << '\n';
        os << "FullName: " << info.family << ' ' << info.style << '\n';
        os << "FamilyName: " << info.family << '\n';
        os << "Weight: " << info.style << '\n';
        if (!info.copyright.empty()) {
            os << "Copyright: " << info.copyright << '\n';
        }
        os << "Version: " << info.version << '\n';
        os << "ItalicAngle: 0\n";
        os << "UnderlinePosition: " << -info.units_per_em / 10 << '\n';
        os << "UnderlineWidth: " << info.units_per_em / 20 << '\n';
        os << "Ascent: " << info.ascent << '\n';
        os << "Descent: " << info.descent << '\n';
        os << "LayerCount: 2\n";
        os << "Layer: 0 0 \"Back\" 1\n";
        os << "Layer: 1 0 \"Fore\" 0\n";
        os << "FSType: 0\n";
        os << "TTFWeight: 400\n";
        os << "TTFWidth: 5\n";
        os << "LineGap: 0\n";
        os << "OS2TypoAscent: " << info.ascent << '\n';
        os << "OS2TypoAOffset: 0\n";
        os << "OS2TypoDescent: " << -info.descent << '\n';
        os << "OS2TypoDOffset: 0\n";
        os << "OS2TypoLinegap: 0\n";
        os << "OS2WinAscent: " << info.ascent << '\n';
        os << "OS2WinAOffset: 0\n";
        os << "OS2WinDescent: " << info.descent << '\n';
        os << "OS2WinDOffset: 0\n";
        os << "HheadAscent: " << info.ascent << '\n';
        os << "HheadAOffset: 0\n";
        os << "HheadDescent: " << -info.descent << '\n';
        os << "HheadDOffset: 0\n";
        os << "Encoding: UnicodeBmp\n";
        os << "UnicodeInterp: none\n";
        os << "BeginChars: 65536 " << doc.size() + 1 << "\n\n";

        // .notdef takes encoding slot 0, which no template character uses.
        write_glyph(os, doc.notdef(), 0, -1);
        for (const auto& [cp, entry] : doc.glyphs()) {
            write_glyph(os, entry, static_cast<int>(cp), static_cast<int>(cp));
        }

        os << "EndChars\n";
        os << "EndSplineFont\n";
        return os.str();
    }

    fontforge_compiler::fontforge_compiler(compiler_settings settings)
        : m_settings(std::move(settings)) {
    }

    std::vector<std::string> fontforge_compiler::command(const std::string& sfd, const std::string& output) const {
        return {m_settings.executable, "-lang=ff", "-c", "Open($1); Generate($2)", sfd, output};
    }

    void fontforge_compiler::compile(const font_document& doc, const std::filesystem::path& output,
                                     const compile_job& job) const {
        std::unique_ptr<work_directory> own;
        const work_directory* work = job.work;
        if (!work) {
            try {
                own = std::make_unique<work_directory>();
            } catch (const std::runtime_error& e) {
                THROW(assembly_error, "fontforge: ", e.what());
            }
            work = own.get();
        }

        const auto sfd_path = work->file("font", ".sfd");
        const auto ttf_path = work->file("font", ".ttf");
        const auto log_path = work->file("fontforge", ".log");

        {
            std::ofstream out(sfd_path, std::ios::binary);
            THROW_IF(!out, assembly_error, "cannot create ", sfd_path.string());
            out << to_sfd(doc);
            THROW_IF(!out, assembly_error, "cannot write ", sfd_path.string());
        }

        process_result result;
        try {
            result = run_process(command(sfd_path.string(), ttf_path.string()), log_path);
        } catch (const std::runtime_error& e) {
            THROW(assembly_error, "fontforge: ", e.what());
        }
        THROW_IF(!result.ok(), assembly_error,
                 m_settings.executable, " failed (exit ", result.exit_code, ", signal ", result.signal, "): ",
                 result.output_tail);

        std::error_code ec;
        const auto size = std::filesystem::file_size(ttf_path, ec);
        THROW_IF(ec || size == 0, assembly_error, "fontforge produced no font at ", ttf_path.string());

        std::filesystem::copy_file(ttf_path, output, std::filesystem::copy_options::overwrite_existing, ec);
        THROW_IF(ec, assembly_error, "cannot copy ", ttf_path.string(), " to ", output.string(), ": ", ec.message());
        LOG_DEBUG("fontforge: generated ", size, " bytes for ", doc.size(), " glyphs");
    }
}  // namespace inkfont
