/**
 * @file font_document.hh
 * @brief Everything a font compiler needs, in one value.
 *
 * A font_document holds the font-level metadata and one glyph_entry per
 * codepoint, kept in codepoint order. Glyph index 0 is always the
 * @c .notdef glyph; the remaining glyphs follow in codepoint order:
 *
 * @code
 *   glyph index   0        1       2       3      ...
 *                 .notdef  space   uni0021 uni0022
 * @endcode
 *
 * Outlines are stored as placed in the font: x already shifted so that the
 * outline's xMin equals the glyph's left bearing.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/glyph_normalizer.hh>
#include <inkfont/metrics.hh>
#include <map>
#include <string>
#include <vector>

namespace inkfont {
    enum class glyph_status : uint8_t {
        inked,        ///< Traced from a drawing
        empty,        ///< Nothing drawn in the cell
        trace_failed, ///< Drawing present but the tracer failed; kept blank
        synthetic     ///< Added by the assembler (.notdef, space)
    };

    [[nodiscard]] INKFONT_EXPORT std::string_view to_string(glyph_status status);

    struct INKFONT_EXPORT glyph_entry {
        char32_t codepoint = 0;
        std::string name;
        glyph_outline outline;
        glyph_metrics metrics;
        glyph_status status = glyph_status::empty;
    };

    /// PostScript glyph name: "space" for U+0020, otherwise "uniXXXX".
    [[nodiscard]] INKFONT_EXPORT std::string glyph_name(char32_t codepoint);

    struct INKFONT_EXPORT font_info {
        std::string family = "Handwriting";
        std::string style = "Regular";
        std::string version = "1.0";
        std::string copyright;
        int units_per_em = 1000;
        int ascent = 800;
        int descent = 200;  ///< Positive distance below the baseline

        /// Family and style without spaces, as used for the PostScript name.
        [[nodiscard]] std::string postscript_name() const;
    };

    class INKFONT_EXPORT font_document {
    public:
        explicit font_document(font_info info);

        [[nodiscard]] const font_info& info() const noexcept { return m_info; }

        /// @throws assembly_error if the codepoint is already present
        void add(glyph_entry entry);

        void set_notdef(glyph_entry entry);
        [[nodiscard]] const glyph_entry& notdef() const noexcept { return m_notdef; }

        [[nodiscard]] bool contains(char32_t codepoint) const;
        [[nodiscard]] const glyph_entry* find(char32_t codepoint) const;

        /// Mapped glyphs, without .notdef.
        [[nodiscard]] std::size_t size() const noexcept { return m_glyphs.size(); }
        [[nodiscard]] const std::map<char32_t, glyph_entry>& glyphs() const noexcept { return m_glyphs; }

        /// All glyphs in glyph index order, .notdef first.
        [[nodiscard]] std::vector<const glyph_entry*> glyph_order() const;

    private:
        font_info m_info;
        glyph_entry m_notdef;
        std::map<char32_t, glyph_entry> m_glyphs;
    };
} // namespace inkfont
