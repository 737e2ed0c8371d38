/**
 * @file template_renderer.hh
 * @brief Draw the blank template the user fills in by hand.
 *
 * Two renditions of the same grid are produced:
 *
 * | Output  | Units                  | Labels                         |
 * |---------|------------------------|--------------------------------|
 * | svg()   | layout pixels (scale 1) | always, as SVG text           |
 * | raster()| layout * raster_scale  | only with a TrueType label font |
 *
 * Every cell gets a black border drawn inside its own rectangle, a faint
 * label in its top-left corner and a faint dashed baseline guide. Labels and
 * guides use gray levels lighter than the extraction threshold, so a blank
 * template read back by the region extractor contains no ink at all.
 *
 * @code{.cpp}
 * auto set = character_set::standard();
 * auto grid = fit_rows(config.grid, set);
 * template_renderer renderer(grid, config.templ);
 * renderer.write_svg("template.svg", set);
 * renderer.write_png("template.png", set);
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
#include <filesystem>
#include <string>

namespace inkfont {
    class ttf_reader;

    class INKFONT_EXPORT template_renderer {
    public:
        /// @p grid must have its rows resolved (see fit_rows).
        template_renderer(const grid_layout& grid, const template_settings& settings);

        /**
         * @brief SVG document of the template.
         * @throws layout_error if the grid cannot hold the set
         */
        [[nodiscard]] std::string svg(const character_set& set) const;

        /**
         * @brief Grayscale raster of the template at raster_scale.
         * @param label_font Font used for cell labels; nullptr draws no labels
         * @throws layout_error if the grid cannot hold the set
         */
        [[nodiscard]] gray_image raster(const character_set& set, const ttf_reader* label_font = nullptr) const;

        /// @throws std::runtime_error on I/O failure
        void write_svg(const std::filesystem::path& path, const character_set& set) const;

        /// @throws std::runtime_error on I/O failure
        void write_png(const std::filesystem::path& path, const character_set& set,
                       const ttf_reader* label_font = nullptr) const;

        [[nodiscard]] int raster_width() const noexcept;
        [[nodiscard]] int raster_height() const noexcept;

    private:
        void draw_cell(gray_image& img, const character_spec& spec, const ttf_reader* label_font) const;

        grid_layout m_grid;
        template_settings m_settings;
    };
} // namespace inkfont
