/**
 * @file metrics.hh
 * @brief Advance width and side bearings of normalized glyphs.
 *
 * For every glyph, inked or not:
 *
 * @code
 *   advance_width == left_bearing + ink_width + right_bearing
 * @endcode
 *
 * where ink_width is the width of glyph_outline::bounds() (0 when empty).
 *
 * | Mode         | left / right                       | advance              |
 * |--------------|------------------------------------|----------------------|
 * | proportional | class spacing table                | left + ink + right   |
 * | monospace    | derived from the placed outline    | monospace_advance    |
 *
 * Empty glyphs never collapse: proportional mode gives them
 * max(min_advance, left + right), monospace mode the fixed advance.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/config.hh>
#include <inkfont/glyph_normalizer.hh>

namespace inkfont {
    struct INKFONT_EXPORT glyph_metrics {
        int advance_width = 0;
        int left_bearing = 0;
        int right_bearing = 0;

        bool operator==(const glyph_metrics&) const = default;
    };

    /// Width of the outline's bounds in whole design units.
    [[nodiscard]] INKFONT_EXPORT int ink_width(const glyph_outline& outline);

    class INKFONT_EXPORT metrics_calculator {
    public:
        metrics_calculator(const spacing_table& spacing, const design_space& design);

        /**
         * @brief Metrics of one glyph.
         * @throws std::out_of_range if the advance does not fit 16 bits
         */
        [[nodiscard]] glyph_metrics measure(const glyph_outline& outline, char_class cls) const;

    private:
        spacing_table m_spacing;
        design_space m_design;
    };
} // namespace inkfont
