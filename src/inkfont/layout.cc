//
// Created by igor on 19/10/2026.
//

#include <inkfont/layout.hh>
#include <inkfont/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>

namespace inkfont {
    namespace {
        constexpr std::string_view UPPER = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
        constexpr std::string_view LOWER = "abcdefghijklmnopqrstuvwxyz";
        constexpr std::string_view DIGITS = "0123456789";
        constexpr std::string_view SYMBOLS = "!@#$%^&*()-_=+[]{}|\\;:\"'<>,./?`~";

        struct class_chars {
            char_class cls;
            std::string_view chars;
        };

        constexpr std::array<class_chars, char_class_count> POLICY = {{
            {char_class::upper, UPPER},
            {char_class::lower, LOWER},
            {char_class::digit, DIGITS},
            {char_class::symbol, SYMBOLS}
        }};
    }

    std::string_view to_string(char_class cls) {
        switch (cls) {
            case char_class::upper: return "upper";
            case char_class::lower: return "lower";
            case char_class::digit: return "digit";
            case char_class::symbol: return "symbol";
        }
        return "unknown";
    }

    std::optional<char_class> parse_char_class(std::string_view name) {
        for (const auto& entry : POLICY) {
            if (to_string(entry.cls) == name) {
                return entry.cls;
            }
        }
        return std::nullopt;
    }

    std::string codepoint_name(char32_t codepoint) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(codepoint));
        return buf;
    }

    character_set character_set::standard() {
        return select({char_class::upper, char_class::lower, char_class::digit, char_class::symbol});
    }

    character_set character_set::select(std::initializer_list<char_class> classes) {
        return select(std::vector<char_class>(classes));
    }

    character_set character_set::select(const std::vector<char_class>& classes) {
        THROW_IF(classes.empty(), layout_error, "character set selection is empty");

        character_set set;
        for (const auto& entry : POLICY) {
            if (std::find(classes.begin(), classes.end(), entry.cls) == classes.end()) {
                continue;
            }
            for (char ch : entry.chars) {
                character_spec spec;
                spec.codepoint = static_cast<char32_t>(static_cast<unsigned char>(ch));
                spec.label = std::string(1, ch);
                spec.cls = entry.cls;
                spec.cell_index = set.m_specs.size();
                set.m_specs.push_back(std::move(spec));
            }
        }
        return set;
    }

    const character_spec& character_set::at(std::size_t index) const {
        THROW_IF(index >= m_specs.size(), std::out_of_range,
                 "character index ", index, " out of range (", m_specs.size(), " characters)");
        return m_specs[index];
    }

    const character_spec* character_set::find(char32_t codepoint) const {
        auto it = std::find_if(m_specs.begin(), m_specs.end(),
                               [codepoint](const character_spec& s) { return s.codepoint == codepoint; });
        return it == m_specs.end() ? nullptr : &*it;
    }

    cell_rect cell_for(const grid_layout& grid, const character_spec& spec) {
        THROW_IF(grid.columns <= 0, layout_error, "grid has no columns");
        THROW_IF(spec.cell_index >= grid.capacity(), layout_error,
                 "cell index ", spec.cell_index, " of '", spec.label,
                 "' exceeds grid capacity ", grid.capacity());

        const auto columns = static_cast<std::size_t>(grid.columns);
        const int row = static_cast<int>(spec.cell_index / columns);
        const int col = static_cast<int>(spec.cell_index % columns);

        return {
            grid.margin + col * grid.cell_width,
            grid.margin + row * grid.cell_height,
            grid.cell_width,
            grid.cell_height
        };
    }

    grid_layout fit_rows(grid_layout grid, const character_set& set) {
        if (grid.rows == 0 && grid.columns > 0) {
            const auto columns = static_cast<std::size_t>(grid.columns);
            grid.rows = static_cast<int>((set.size() + columns - 1) / columns);
        }
        return grid;
    }

    void validate(const grid_layout& grid, const character_set& set) {
        THROW_IF(grid.rows <= 0 || grid.columns <= 0, layout_error,
                 "grid must have positive rows and columns, got ", grid.rows, "x", grid.columns);
        THROW_IF(grid.cell_width <= 0 || grid.cell_height <= 0, layout_error,
                 "cell size must be positive, got ", grid.cell_width, "x", grid.cell_height);
        THROW_IF(grid.margin < 0 || grid.border_thickness < 0 || grid.safety_margin < 0, layout_error,
                 "margin, border thickness and safety margin must not be negative");
        THROW_IF(2 * grid.inset() >= std::min(grid.cell_width, grid.cell_height), layout_error,
                 "inset of ", grid.inset(), " leaves no interior in a ",
                 grid.cell_width, "x", grid.cell_height, " cell");
        THROW_IF(!(grid.baseline_ratio > 0.0 && grid.baseline_ratio <= 1.0), layout_error,
                 "baseline ratio must be in (0, 1], got ", grid.baseline_ratio);
        THROW_IF(set.size() > grid.capacity(), layout_error,
                 "grid of ", grid.rows, "x", grid.columns, " cells cannot hold ", set.size(), " characters");

        for (std::size_t i = 0; i < set.size(); ++i) {
            const auto& spec = set.at(i);
            THROW_IF(spec.cell_index != i, layout_error,
                     "character '", spec.label, "' has cell index ", spec.cell_index, ", expected ", i);
        }
    }

    int scale_coord(double value, double scale) {
        return static_cast<int>(std::lround(value * scale));
    }

    cell_rect scale_rect(const cell_rect& r, double scale) {
        const int x0 = scale_coord(r.x, scale);
        const int y0 = scale_coord(r.y, scale);
        const int x1 = scale_coord(r.x + r.width, scale);
        const int y1 = scale_coord(r.y + r.height, scale);
        return {x0, y0, x1 - x0, y1 - y0};
    }
}  // namespace inkfont
