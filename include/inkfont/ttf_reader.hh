/**
 * @file ttf_reader.hh
 * @brief Read-only access to a TrueType font through stb_truetype.
 *
 * ttf_reader has two jobs in the pipeline:
 *
 * - the template renderer uses it to rasterize cell labels into the raster
 *   template;
 * - tests and the example program use it to load a compiled font back and
 *   check what the assembler put into it.
 *
 * All metrics are in font units (not pixels) unless stated otherwise.
 *
 * @section ttf_reader_usage Usage
 *
 * @code{.cpp}
 * auto font = ttf_reader::load("out.ttf");
 * if (font.is_valid() && font.has_glyph(U'A')) {
 *     auto m = font.hmetrics(U'A');        // advance and left bearing
 *     auto box = font.glyph_box(U'A');     // ink box, empty glyphs have none
 * }
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace inkfont {
    /// Glyph box in font units (y up).
    struct INKFONT_EXPORT ttf_glyph_box {
        int x_min = 0;
        int y_min = 0;
        int x_max = 0;
        int y_max = 0;
    };

    /// Horizontal metrics in font units.
    struct INKFONT_EXPORT ttf_hmetrics {
        int advance_width = 0;
        int left_bearing = 0;
    };

    struct INKFONT_EXPORT ttf_vmetrics {
        int ascent = 0;
        int descent = 0;   ///< Negative below the baseline, as stored in hhea
        int line_gap = 0;
    };

    /**
     * @brief Antialiased coverage bitmap of one glyph.
     */
    struct INKFONT_EXPORT label_bitmap {
        std::vector<uint8_t> coverage;  ///< width * height bytes, 0..255
        int width = 0;
        int height = 0;
        int offset_x = 0;               ///< From pen position to left edge
        int offset_y = 0;               ///< From baseline to top edge (negative is up)
        float advance = 0.0f;           ///< In pixels
    };

    class INKFONT_EXPORT ttf_reader {
    public:
        /**
         * @brief Take ownership of font file bytes.
         *
         * Invalid data does not throw; check is_valid().
         */
        explicit ttf_reader(std::vector<uint8_t> bytes, int font_index = 0);

        /// @throws std::runtime_error if the file cannot be read
        [[nodiscard]] static ttf_reader load(const std::filesystem::path& path);

        ~ttf_reader();
        ttf_reader(ttf_reader&& other) noexcept;
        ttf_reader& operator=(ttf_reader&& other) noexcept;

        /// @cond
        ttf_reader(const ttf_reader&) = delete;
        ttf_reader& operator=(const ttf_reader&) = delete;
        /// @endcond

        [[nodiscard]] bool is_valid() const;

        [[nodiscard]] int units_per_em() const;
        [[nodiscard]] ttf_vmetrics vmetrics() const;
        [[nodiscard]] int glyph_count() const;

        /// Family name (name ID 1) from the Windows Unicode record, empty if absent.
        [[nodiscard]] std::string family_name() const;

        [[nodiscard]] bool has_glyph(char32_t codepoint) const;

        /// Ink box, std::nullopt for a missing glyph or a glyph without contours.
        [[nodiscard]] std::optional<ttf_glyph_box> glyph_box(char32_t codepoint) const;

        [[nodiscard]] std::optional<ttf_hmetrics> hmetrics(char32_t codepoint) const;

        /// Number of closed contours of the glyph outline (0 when missing or empty).
        [[nodiscard]] int contour_count(char32_t codepoint) const;

        /**
         * @brief Rasterize a glyph at a pixel height (ascent - descent).
         * @return std::nullopt if the font is invalid or lacks the glyph
         */
        [[nodiscard]] std::optional<label_bitmap> rasterize(char32_t codepoint, float pixel_height) const;

        [[nodiscard]] std::span<const uint8_t> bytes() const;

    private:
        struct impl;
        std::unique_ptr<impl> m_impl;
    };
} // namespace inkfont
