/**
 * @file region_extractor.hh
 * @brief Crop and binarize the cells of a filled-in template.
 *
 * Extraction is split in two steps so the source image is checked exactly
 * once, before any cell is touched:
 *
 * @code{.cpp}
 * region_extractor extractor(grid, config.extraction);
 * prepared_source src = extractor.prepare(scan);      // throws extraction_error
 * for (const auto& spec : set) {
 *     extracted_cell cell = extractor.extract(src, spec);
 *     if (cell.empty()) continue;                      // nothing drawn
 *     trace(cell.image->bits);
 * }
 * @endcode
 *
 * A prepared_source can only be obtained from prepare(), so extract() never
 * sees an image that failed validation.
 *
 * @section extractor_scale Resolution
 *
 * The template may have been rasterized, printed or scanned at any uniform
 * scale of at least 1. The scale is derived from the image width and must
 * agree with the image height within one scaled pixel. Every cell coordinate
 * goes through scale_coord() with that scale, exactly as the renderer does.
 *
 * @section extractor_frame Cell Frame
 *
 * @code
 *   source image
 *   +------------------------------------------+
 *   |   origin_x,origin_y                      |
 *   |        +-------------+  <- crop (inset)  |
 *   |        |   local     |                   |
 *   |        |   pixels    |                   |
 *   |        |- - - - - - -|  <- baseline_y    |
 *   |        +-------------+                   |
 *   +------------------------------------------+
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/config.hh>
#include <inkfont/image.hh>
#include <inkfont/layout.hh>
#include <inkfont/utils/ink_bitmap.hh>
#include <cstddef>
#include <optional>

namespace inkfont {
    /**
     * @brief How a cell's local pixels relate to the template.
     */
    struct INKFONT_EXPORT cell_frame {
        double scale = 1.0;       ///< Source pixels per template pixel
        double baseline_y = 0.0;  ///< Baseline guide row in local pixel coordinates
    };

    /// Binarized crop of one cell.
    struct INKFONT_EXPORT cell_image {
        int origin_x = 0;    ///< Crop origin inside the source image
        int origin_y = 0;
        cell_frame frame;
        ink_bitmap bits;
    };

    /// Result of extracting one cell. An empty cell carries no image.
    struct INKFONT_EXPORT extracted_cell {
        std::size_t cell_index = 0;
        std::size_t ink_pixels = 0;
        std::optional<cell_image> image;

        [[nodiscard]] bool empty() const noexcept { return !image.has_value(); }
    };

    /**
     * @brief Source image that passed validation against a grid.
     *
     * Holds a reference to the image; the image must outlive it.
     */
    class INKFONT_EXPORT prepared_source {
    public:
        [[nodiscard]] const gray_image& image() const noexcept { return *m_image; }
        [[nodiscard]] double scale() const noexcept { return m_scale; }

    private:
        friend class region_extractor;
        prepared_source(const gray_image& image, double scale) noexcept
            : m_image(&image), m_scale(scale) {
        }

        const gray_image* m_image;
        double m_scale;
    };

    class INKFONT_EXPORT region_extractor {
    public:
        /// @p grid must have its rows resolved (see fit_rows).
        region_extractor(const grid_layout& grid, const extraction_settings& settings);

        /**
         * @brief Validate the image against the grid and derive its scale.
         *
         * @throws extraction_error if the image is empty, smaller than the
         *         grid, or scaled differently along x and y
         */
        [[nodiscard]] prepared_source prepare(const gray_image& source) const;

        /**
         * @brief Crop, binarize and classify one cell.
         * @throws layout_error if the character does not fit the grid
         */
        [[nodiscard]] extracted_cell extract(const prepared_source& source, const character_spec& spec) const;

        /// Ink pixel count below which a cell is empty at the given scale.
        [[nodiscard]] std::size_t min_ink(double scale) const noexcept;

    private:
        grid_layout m_grid;
        extraction_settings m_settings;
    };
} // namespace inkfont
