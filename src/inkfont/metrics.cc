//
// Created by igor on 19/10/2026.
//

#include <inkfont/metrics.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cmath>

namespace inkfont {
    int ink_width(const glyph_outline& outline) {
        const bbox b = outline.bounds();
        return b.valid ? static_cast<int>(std::lround(b.width())) : 0;
    }

    metrics_calculator::metrics_calculator(const spacing_table& spacing, const design_space& design)
        : m_spacing(spacing), m_design(design) {
    }

    glyph_metrics metrics_calculator::measure(const glyph_outline& outline, char_class cls) const {
        const spacing_entry& rule = m_spacing.at(cls);
        const int ink = ink_width(outline);

        glyph_metrics m;
        if (m_spacing.mode == spacing_mode::monospace) {
            m.advance_width = m_spacing.monospace_advance;
            if (outline.empty()) {
                m.left_bearing = rule.left_bearing;
            } else {
                const double cell_left = m_design.center_line - m_spacing.monospace_advance / 2.0;
                m.left_bearing = static_cast<int>(std::lround(outline.bounds().x_min - cell_left));
            }
        } else if (outline.empty()) {
            m.left_bearing = rule.left_bearing;
            m.advance_width = std::max(rule.min_advance, rule.left_bearing + rule.right_bearing);
        } else {
            m.left_bearing = rule.left_bearing;
            m.advance_width = rule.left_bearing + ink + rule.right_bearing;
        }
        m.right_bearing = m.advance_width - m.left_bearing - ink;

        THROW_IF(m.advance_width < 0 || m.advance_width > 65535, std::out_of_range,
                 "advance width ", m.advance_width, " does not fit the font");
        return m;
    }
}  // namespace inkfont
