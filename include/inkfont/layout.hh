/**
 * @file layout.hh
 * @brief Template grid model: which character lives in which cell.
 *
 * The layout model is pure data plus pure functions. Every other stage
 * (template rendering, region extraction, normalization) derives its cell
 * coordinates from cell_for(), so the drawing the user fills in and the
 * regions read back always agree.
 *
 * @section layout_grid Grid Geometry
 *
 * @code
 *   margin
 *   |<->|
 *   +---------------------------------------------+
 *   |                                             |
 *   |   +-------+-------+-------+-------+         |
 *   |   | A     | B     | C     | D     |  ...    |   cell_index = row * columns + col
 *   |   |       |       |       |       |         |
 *   |   |- - - -|- - - -|- - - -|- - - -|         |   <- baseline guide (baseline_ratio)
 *   |   +-------+-------+-------+-------+         |
 *   |   | E     | ...                             |
 *   |   |<----->|                                 |
 *   |   cell_width                                |
 *   +---------------------------------------------+
 * @endcode
 *
 * Cells are contiguous: the border of each cell is drawn inside its own
 * rectangle with thickness @c border_thickness, and the region extractor
 * insets by @c border_thickness + @c safety_margin to drop it.
 *
 * @section layout_charset Character Set
 *
 * The fixed policy holds 94 characters: A-Z, a-z, 0-9 and 32 ASCII symbols.
 * A selection keeps that canonical order and numbers the cells from zero.
 *
 * @code{.cpp}
 * auto set = character_set::select({char_class::upper, char_class::digit});
 * grid_layout grid = fit_rows(default_grid(), set);
 * validate(grid, set);
 * cell_rect r = cell_for(grid, set.at(0));   // 'A'
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inkfont {
    /**
     * @brief Character class. Selects scale, offset and spacing rules.
     */
    enum class char_class : uint8_t {
        upper,
        lower,
        digit,
        symbol
    };

    /// Number of character classes.
    inline constexpr std::size_t char_class_count = 4;

    [[nodiscard]] INKFONT_EXPORT std::string_view to_string(char_class cls);
    [[nodiscard]] INKFONT_EXPORT std::optional<char_class> parse_char_class(std::string_view name);

    /// "U+0041" style notation used in messages and file names.
    [[nodiscard]] INKFONT_EXPORT std::string codepoint_name(char32_t codepoint);

    /**
     * @brief One character of the template.
     */
    struct INKFONT_EXPORT character_spec {
        char32_t codepoint = 0;
        std::string label;       ///< UTF-8 text shown in the template cell
        char_class cls = char_class::symbol;
        std::size_t cell_index = 0;
    };

    /**
     * @brief Ordered, immutable list of characters with unique codepoints and
     *        consecutive cell indices starting at zero.
     */
    class INKFONT_EXPORT character_set {
    public:
        /// Full 94 character policy.
        [[nodiscard]] static character_set standard();

        /**
         * @brief Subset of the policy restricted to the given classes.
         *
         * Canonical order is kept whatever order the classes are passed in.
         *
         * @throws layout_error if no class is selected
         */
        [[nodiscard]] static character_set select(std::initializer_list<char_class> classes);
        [[nodiscard]] static character_set select(const std::vector<char_class>& classes);

        [[nodiscard]] std::size_t size() const noexcept { return m_specs.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_specs.empty(); }
        [[nodiscard]] const character_spec& at(std::size_t index) const;
        [[nodiscard]] const character_spec* find(char32_t codepoint) const;

        [[nodiscard]] auto begin() const noexcept { return m_specs.begin(); }
        [[nodiscard]] auto end() const noexcept { return m_specs.end(); }

    private:
        character_set() = default;
        std::vector<character_spec> m_specs;
    };

    /**
     * @brief Rectangle in template pixel coordinates (origin top-left).
     */
    struct INKFONT_EXPORT cell_rect {
        int x = 0;
        int y = 0;
        int width = 0;
        int height = 0;

        bool operator==(const cell_rect&) const = default;
    };

    /**
     * @brief Template grid geometry, in template pixels at scale 1.
     */
    struct INKFONT_EXPORT grid_layout {
        int rows = 0;               ///< 0 means "fit to character set" (see fit_rows)
        int columns = 13;
        int cell_width = 200;
        int cell_height = 200;
        int margin = 20;
        int border_thickness = 4;
        int safety_margin = 4;      ///< Extra inset past the border when cropping
        double baseline_ratio = 0.75;

        [[nodiscard]] int width() const noexcept { return 2 * margin + columns * cell_width; }
        [[nodiscard]] int height() const noexcept { return 2 * margin + rows * cell_height; }
        [[nodiscard]] std::size_t capacity() const noexcept {
            return static_cast<std::size_t>(rows) * static_cast<std::size_t>(columns);
        }
        /// Pixels removed from each side of a cell before binarization.
        [[nodiscard]] int inset() const noexcept { return border_thickness + safety_margin; }
        /// Distance from the top of a cell to its baseline guide.
        [[nodiscard]] double baseline_offset() const noexcept { return cell_height * baseline_ratio; }
    };

    /**
     * @brief Cell rectangle of a character.
     *
     * row = cell_index / columns, col = cell_index % columns,
     * origin = (margin + col * cell_width, margin + row * cell_height).
     *
     * @throws layout_error if cell_index is outside rows x columns
     */
    [[nodiscard]] INKFONT_EXPORT cell_rect cell_for(const grid_layout& grid, const character_spec& spec);

    /// Same grid with @c rows computed from the set when it is 0.
    [[nodiscard]] INKFONT_EXPORT grid_layout fit_rows(grid_layout grid, const character_set& set);

    /**
     * @brief Check grid geometry against a character set.
     *
     * @throws layout_error on non-positive sizes, an inset that leaves no
     *         interior, a baseline outside the cell, or too few cells
     */
    INKFONT_EXPORT void validate(const grid_layout& grid, const character_set& set);

    /// Map a template coordinate to a source image scaled by @p scale.
    [[nodiscard]] INKFONT_EXPORT int scale_coord(double value, double scale);

    /// Rectangle scaled by @p scale with the same rounding as scale_coord.
    [[nodiscard]] INKFONT_EXPORT cell_rect scale_rect(const cell_rect& r, double scale);
} // namespace inkfont
