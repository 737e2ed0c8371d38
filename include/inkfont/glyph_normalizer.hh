/**
 * @file glyph_normalizer.hh
 * @brief Map traced pixel contours into font design space.
 *
 * The mapping is one affine transform built from four named steps, applied
 * in this order:
 *
 * | Step              | Transform                                         |
 * |-------------------|---------------------------------------------------|
 * | 1. anchor         | translate(-ink_center_x, -baseline_y)             |
 * | 2. glyph scale    | scale(scale_factor / (pixels_per_unit * scale))   |
 * | 3. flip           | (x, y) -> (x, -y)                                 |
 * | 4. place          | translate(center_line, vertical_offset)           |
 *
 * @c scale_factor and @c vertical_offset are those of the character's class
 * unless the configuration overrides them for that character
 * (scale_config::resolve). @c ink_center_x is the middle of the tight curve
 * box (curve_bounds), so a bulging control hull does not pull the glyph off
 * centre.
 *
 * The scale is uniform, so glyphs never distort. @c scale is the resolution
 * of the source image relative to the template (cell_frame::scale), which
 * makes a template scanned at 4x produce the same glyph as one at 1x.
 *
 * Coordinates are rounded to whole design units because that is what the
 * font stores; the outline's bounds are therefore integers, and metrics
 * computed from them are exact. Those bounds include control points, as the
 * glyf bounding box does. Normalization is a pure function.
 *
 * @code{.cpp}
 * glyph_normalizer normalizer(config.scales, config.design);
 * glyph_outline outline = normalizer.normalize(path, cell.image->frame, spec);
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/config.hh>
#include <inkfont/geometry.hh>
#include <inkfont/region_extractor.hh>
#include <inkfont/tracing/trace_engine.hh>
#include <vector>

namespace inkfont {
    /**
     * @brief Glyph contours in design units (origin on the baseline, y up).
     */
    struct INKFONT_EXPORT glyph_outline {
        std::vector<contour> contours;

        [[nodiscard]] bool empty() const noexcept { return contours.empty(); }
        [[nodiscard]] bbox bounds() const { return control_bounds(contours); }

        bool operator==(const glyph_outline&) const = default;
    };

    /// Pixel space (y down) to font space (y up).
    [[nodiscard]] INKFONT_EXPORT affine flip_to_font_space() noexcept;

    /// Same outline with every point shifted by (dx, dy).
    [[nodiscard]] INKFONT_EXPORT glyph_outline translated(const glyph_outline& outline, double dx, double dy);

    class INKFONT_EXPORT glyph_normalizer {
    public:
        glyph_normalizer(const scale_config& scales, const design_space& design);

        /// Scale entry for @p spec: its class's, with any per-character override applied.
        [[nodiscard]] scale_entry entry_for(const character_spec& spec) const;

        /// Uniform pixel to design unit factor for a character at a source resolution.
        [[nodiscard]] double unit_scale(const character_spec& spec, double resolution_scale) const;
        /// Same for the class settings alone.
        [[nodiscard]] double unit_scale(char_class cls, double resolution_scale) const noexcept;

        /**
         * @brief Complete pixel to design space transform for one path.
         *
         * An empty path has no ink center; the anchor step then uses x = 0.
         */
        [[nodiscard]] affine transform_for(const raw_path& path, const cell_frame& frame,
                                           const character_spec& spec) const;
        [[nodiscard]] affine transform_for(const raw_path& path, const cell_frame& frame, char_class cls) const;

        /// Transform, round to design units and drop contours that collapse.
        [[nodiscard]] glyph_outline normalize(const raw_path& path, const cell_frame& frame,
                                              const character_spec& spec) const;
        [[nodiscard]] glyph_outline normalize(const raw_path& path, const cell_frame& frame, char_class cls) const;

    private:
        [[nodiscard]] double unit_scale(const scale_entry& entry, double resolution_scale) const noexcept;
        [[nodiscard]] affine transform_for(const raw_path& path, const cell_frame& frame,
                                           const scale_entry& entry) const;
        [[nodiscard]] glyph_outline normalize(const raw_path& path, const cell_frame& frame,
                                              const scale_entry& entry) const;

        scale_config m_scales;
        design_space m_design;
    };
} // namespace inkfont
