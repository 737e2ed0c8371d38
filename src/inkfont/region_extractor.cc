//
// Created by igor on 19/10/2026.
//

#include <inkfont/region_extractor.hh>
#include <inkfont/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cmath>

namespace inkfont {
    region_extractor::region_extractor(const grid_layout& grid, const extraction_settings& settings)
        : m_grid(grid), m_settings(settings) {
    }

    prepared_source region_extractor::prepare(const gray_image& source) const {
        THROW_IF(source.empty(), extraction_error, "source image is empty");

        const int layout_w = m_grid.width();
        const int layout_h = m_grid.height();
        THROW_IF(layout_w <= 0 || layout_h <= 0, extraction_error,
                 "grid has no area (", layout_w, "x", layout_h, ")");

        const double scale = static_cast<double>(source.width()) / layout_w;
        THROW_IF(scale < 1.0 || source.height() < layout_h, extraction_error,
                 "source image ", source.width(), "x", source.height(),
                 " is smaller than the ", layout_w, "x", layout_h, " template grid");

        const double expected_h = layout_h * scale;
        THROW_IF(std::fabs(source.height() - expected_h) > std::max(1.0, scale), extraction_error,
                 "source image ", source.width(), "x", source.height(),
                 " is not a uniform scale of the ", layout_w, "x", layout_h,
                 " template grid (expected height ", expected_h, ")");

        return {source, scale};
    }

    std::size_t region_extractor::min_ink(double scale) const noexcept {
        return static_cast<std::size_t>(std::lround(m_settings.min_ink_pixels * scale * scale));
    }

    extracted_cell region_extractor::extract(const prepared_source& source, const character_spec& spec) const {
        const gray_image& img = source.image();
        const double scale = source.scale();

        const cell_rect cell = cell_for(m_grid, spec);
        const cell_rect r = scale_rect(cell, scale);
        const int inset = scale_coord(m_grid.inset(), scale);

        const int x0 = std::clamp(r.x + inset, 0, img.width());
        const int y0 = std::clamp(r.y + inset, 0, img.height());
        const int x1 = std::clamp(r.x + r.width - inset, x0, img.width());
        const int y1 = std::clamp(r.y + r.height - inset, y0, img.height());

        extracted_cell out;
        out.cell_index = spec.cell_index;

        ink_bitmap bits(x1 - x0, y1 - y0);
        std::size_t ink = 0;
        for (int y = y0; y < y1; ++y) {
            const auto row = img.row(y);
            for (int x = x0; x < x1; ++x) {
                if (row[static_cast<std::size_t>(x)] < m_settings.threshold) {
                    bits.set_pixel(x - x0, y - y0);
                    ++ink;
                }
            }
        }
        out.ink_pixels = ink;

        if (ink == 0 || ink < min_ink(scale)) {
            return out;
        }

        cell_image image;
        image.origin_x = x0;
        image.origin_y = y0;
        image.frame.scale = scale;
        image.frame.baseline_y = (cell.y + m_grid.baseline_offset()) * scale - y0;
        image.bits = std::move(bits);
        out.image = std::move(image);
        return out;
    }
}  // namespace inkfont
