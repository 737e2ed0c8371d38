//
// Created by igor on 19/10/2026.
//

#include <inkfont/font_assembler.hh>
#include <inkfont/errors.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

namespace inkfont {
    namespace {
        contour rectangle(double x0, double y0, double x1, double y1, bool clockwise) {
            contour c;
            c.start = {x0, y0};
            if (clockwise) {
                c.segments = {segment::line_to({x0, y1}), segment::line_to({x1, y1}), segment::line_to({x1, y0})};
            } else {
                c.segments = {segment::line_to({x1, y0}), segment::line_to({x1, y1}), segment::line_to({x0, y1})};
            }
            return c;
        }

        std::string describe(const character_spec& spec) {
            return spec.label + " (" + codepoint_name(spec.codepoint) + ")";
        }

        // Creates an empty file with a unique name in the output's directory.
        std::filesystem::path make_temporary(const std::filesystem::path& output) {
            std::filesystem::path dir = output.parent_path();
            if (dir.empty()) {
                dir = ".";
            }
            std::string pattern = (dir / ("." + output.filename().string() + ".inkfont-XXXXXX")).string();
            std::vector<char> buffer(pattern.begin(), pattern.end());
            buffer.push_back('\0');
            const int fd = ::mkstemp(buffer.data());
            THROW_IF(fd < 0, assembly_error, "cannot create a temporary file in ", dir.string(), ": ",
                     std::strerror(errno));
            ::close(fd);
            return buffer.data();
        }

        void discard(const std::filesystem::path& temp) {
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            if (ec) {
                LOG_WARN("cannot remove temporary font ", temp.string(), ": ", ec.message());
            }
        }
    }

    glyph_outline place(const glyph_outline& outline, const glyph_metrics& metrics) {
        if (outline.empty()) {
            return outline;
        }
        return translated(outline, metrics.left_bearing - outline.bounds().x_min, 0.0);
    }

    std::string missing_characters(const font_document& doc, const character_set& set) {
        std::string out;
        for (const auto& spec : set) {
            if (doc.contains(spec.codepoint)) {
                continue;
            }
            if (!out.empty()) {
                out += ", ";
            }
            out += describe(spec);
        }
        return out;
    }

    font_assembler::font_assembler(const font_settings& font, const design_space& design)
        : m_font(font), m_design(design) {
    }

    font_info font_assembler::info() const {
        font_info info;
        info.family = m_font.name;
        info.version = m_font.version;
        info.copyright = m_font.copyright;
        info.units_per_em = m_design.units_per_em;
        info.ascent = m_design.ascent;
        info.descent = m_design.descent;
        return info;
    }

    glyph_entry font_assembler::notdef_glyph() const {
        const int upm = m_design.units_per_em;
        const int advance = upm / 2;
        const int side = upm / 20;
        const int stroke = std::max(1, upm / 20);
        const int top = std::max(2 * stroke + 1, m_design.ascent * 7 / 8);

        glyph_entry e;
        e.outline.contours.push_back(rectangle(side, 0, advance - side, top, true));
        e.outline.contours.push_back(rectangle(side + stroke, stroke, advance - side - stroke, top - stroke, false));
        e.metrics = {advance, side, side};
        return e;
    }

    glyph_entry font_assembler::space_glyph() const {
        glyph_entry e;
        e.codepoint = U' ';
        e.metrics = {m_font.space_width, 0, m_font.space_width};
        e.status = glyph_status::synthetic;
        return e;
    }

    font_document font_assembler::assemble(const character_set& set, const std::vector<glyph_result>& results) const {
        font_document doc(info());
        doc.set_notdef(notdef_glyph());

        std::string unexpected;
        for (const auto& r : results) {
            const character_spec* spec = set.find(r.codepoint);
            if (!spec) {
                unexpected += unexpected.empty() ? "" : ", ";
                unexpected += codepoint_name(r.codepoint);
                continue;
            }
            THROW_IF(spec->cell_index != r.cell_index, assembly_error,
                     "result for ", describe(*spec), " comes from cell ", r.cell_index,
                     " instead of cell ", spec->cell_index);

            glyph_entry e;
            e.codepoint = r.codepoint;
            e.outline = place(r.outline, r.metrics);
            e.metrics = r.metrics;
            e.status = r.status;
            doc.add(std::move(e));
        }
        THROW_IF(!unexpected.empty(), assembly_error, "glyphs for characters outside the set: ", unexpected);

        const std::string missing = missing_characters(doc, set);
        THROW_IF(!missing.empty(), assembly_error, "no glyph for ", missing);

        if (!doc.contains(U' ')) {
            doc.add(space_glyph());
        }
        return doc;
    }

    void font_assembler::emit(const font_document& doc, const character_set& set, const font_compiler& compiler,
                              const std::filesystem::path& output, const compile_job& job) const {
        const std::string missing = missing_characters(doc, set);
        THROW_IF(!missing.empty(), assembly_error, "font document has no glyph for ", missing);

        const std::filesystem::path temp = make_temporary(output);
        try {
            compiler.compile(doc, temp, job);

            std::error_code ec;
            const auto size = std::filesystem::file_size(temp, ec);
            THROW_IF(ec || size == 0, assembly_error, compiler.name(), " wrote no font data");

            // mkstemp creates the file private to the owner.
            using std::filesystem::perms;
            std::filesystem::permissions(temp, perms::owner_read | perms::owner_write | perms::group_read |
                                               perms::others_read, ec);
            if (ec) {
                LOG_WARN("cannot set permissions of ", temp.string(), ": ", ec.message());
            }

            std::filesystem::rename(temp, output, ec);
            THROW_IF(ec, assembly_error, "cannot move font to ", output.string(), ": ", ec.message());
        } catch (const assembly_error&) {
            discard(temp);
            throw;
        } catch (const std::exception& e) {
            discard(temp);
            THROW(assembly_error, compiler.name(), " compiler failed: ", e.what());
        }
        LOG_INFO("wrote ", doc.size(), " glyphs to ", output.string(), " with the ", compiler.name(), " compiler");
    }
}  // namespace inkfont
