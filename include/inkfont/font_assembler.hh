/**
 * @file font_assembler.hh
 * @brief Join point of the pipeline: per-cell glyphs in, font file out.
 *
 * @section assembler_assemble Assembly
 *
 * assemble() turns one glyph_result per character into a font_document:
 *
 * - every character of the set must have exactly one result, otherwise
 *   assembly_error names the characters that are missing or unexpected;
 * - each outline is shifted horizontally so that its xMin equals its left
 *   bearing (hmtx convention: the advance starts at x = 0);
 * - a @c .notdef box and, unless the set draws one, a blank @c space glyph
 *   of @c space_width are added.
 *
 * @section assembler_emit Emission
 *
 * emit() is atomic for the caller. The compiler writes to a uniquely named
 * file next to the output, which is renamed over the output only once it is
 * complete:
 *
 * @code
 *   out/.Handwriting.ttf.inkfont-Xa81Qz   --rename-->   out/Handwriting.ttf
 * @endcode
 *
 * Any failure removes the temporary file and raises assembly_error, so the
 * output path either holds a complete font or is left untouched.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/compile/font_compiler.hh>
#include <inkfont/config.hh>
#include <inkfont/font_document.hh>
#include <inkfont/layout.hh>
#include <filesystem>
#include <string>
#include <vector>

namespace inkfont {
    /**
     * @brief Output of the per-cell stages for one character.
     *
     * The outline is in design space as produced by the normalizer, not yet
     * placed in its advance.
     */
    struct INKFONT_EXPORT glyph_result {
        std::size_t cell_index = 0;
        char32_t codepoint = 0;
        glyph_outline outline;
        glyph_metrics metrics;
        glyph_status status = glyph_status::empty;
        std::size_t ink_pixels = 0;
        std::string failure;  ///< Tracing failure message when status is trace_failed
    };

    class INKFONT_EXPORT font_assembler {
    public:
        font_assembler(const font_settings& font, const design_space& design);

        /**
         * @brief Build the document for @p set.
         * @throws assembly_error if a character has no result, or a result
         *         belongs to no character of the set
         */
        [[nodiscard]] font_document assemble(const character_set& set, const std::vector<glyph_result>& results) const;

        /**
         * @brief Compile @p doc to @p output atomically.
         * @throws assembly_error if a character of @p set is missing from the
         *         document or compilation fails; @p output is not touched
         */
        void emit(const font_document& doc, const character_set& set, const font_compiler& compiler,
                  const std::filesystem::path& output, const compile_job& job = compile_job{}) const;

        [[nodiscard]] font_info info() const;

        /// Rectangle with a rectangular hole, the usual missing-glyph box.
        [[nodiscard]] glyph_entry notdef_glyph() const;

        [[nodiscard]] glyph_entry space_glyph() const;

    private:
        font_settings m_font;
        design_space m_design;
    };

    /// Outline shifted so that its xMin equals the left bearing.
    [[nodiscard]] INKFONT_EXPORT glyph_outline place(const glyph_outline& outline, const glyph_metrics& metrics);

    /**
     * @brief Characters of @p set without a glyph in @p doc.
     * @return "A (U+0041), b (U+0062)" style list, empty when complete
     */
    [[nodiscard]] INKFONT_EXPORT std::string missing_characters(const font_document& doc, const character_set& set);
} // namespace inkfont
