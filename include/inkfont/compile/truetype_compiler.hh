/**
 * @file truetype_compiler.hh
 * @brief Built-in writer of static TrueType (glyf) fonts.
 *
 * Produces a complete font without any external tool. The file carries the
 * ten tables a TrueType outline font needs:
 *
 * | Table | Content                                                     |
 * |-------|-------------------------------------------------------------|
 * | head  | units per em, global bbox, long loca, checkSumAdjustment    |
 * | hhea  | ascent, descent, advance and bearing extremes               |
 * | maxp  | version 1.0 with point and contour maxima                   |
 * | OS/2  | version 4, weight 400, Basic Latin range                    |
 * | hmtx  | one long metric per glyph                                   |
 * | cmap  | format 4 subtable for (0,3) and (3,1)                       |
 * | loca  | long offsets                                                |
 * | glyf  | simple glyphs; blank glyphs have zero length                |
 * | name  | IDs 0 to 6 as Windows Unicode (UTF-16BE) records            |
 * | post  | version 3.0 (no glyph names)                                |
 *
 * Glyph index 0 is @c .notdef, the rest follow font_document::glyph_order().
 * TrueType outlines are quadratic, so cubic segments are split into
 * quadratic ones that stay within half a design unit of the cubic.
 *
 * @code{.cpp}
 * truetype_compiler compiler;
 * std::vector<uint8_t> bytes = compiler.encode(doc);
 * ttf_reader reader(std::move(bytes));
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/compile/font_compiler.hh>
#include <inkfont/geometry.hh>
#include <cstdint>
#include <vector>

namespace inkfont {
    class INKFONT_EXPORT truetype_compiler final : public font_compiler {
    public:
        /**
         * @brief Font file bytes for @p doc.
         * @throws assembly_error if the document cannot be represented
         *         (codepoints outside the BMP, coordinates outside 16 bits)
         */
        [[nodiscard]] std::vector<uint8_t> encode(const font_document& doc) const;

        using font_compiler::compile;
        void compile(const font_document& doc, const std::filesystem::path& output,
                     const compile_job& job) const override;
        [[nodiscard]] std::string_view name() const noexcept override { return "truetype"; }
    };

    /**
     * @brief Quadratic segments approximating the cubic from @p from.
     *
     * Halves the cubic until each piece's single-quadratic error estimate is
     * within @p tolerance.
     */
    [[nodiscard]] INKFONT_EXPORT std::vector<segment> quadratic_approximation(point from, const segment& cubic,
                                                                              double tolerance = 0.5);

    /// OpenType table checksum: sum of big-endian 32-bit words, zero padded.
    [[nodiscard]] INKFONT_EXPORT uint32_t table_checksum(const uint8_t* data, std::size_t size) noexcept;
} // namespace inkfont
