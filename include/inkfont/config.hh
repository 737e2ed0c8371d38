/**
 * @file config.hh
 * @brief Read-only configuration of a font generation job.
 *
 * Configuration is loaded once from a JSON document and then passed by const
 * reference into every stage. No stage keeps a pointer to global state, so
 * stages can run concurrently on worker threads without locking.
 *
 * @section config_file Document Layout
 *
 * @code{.json}
 * {
 *   "grid":       { "columns": 13, "cell_width": 200, "cell_height": 200,
 *                   "margin": 20, "border_thickness": 4, "safety_margin": 4,
 *                   "baseline_ratio": 0.75 },
 *   "classes":    { "upper": { "scale_factor": 4.0, "vertical_offset": 0,
 *                              "left_bearing": 25, "right_bearing": 25,
 *                              "min_advance": 250 },
 *                   "lower": { "overrides": { "g": { "vertical_offset": -150 },
 *                                             "f": { "scale_factor": 2.5 } } } },
 *   "extraction": { "threshold": 140, "min_ink_pixels": 20 },
 *   "tracing":    { "engine": "builtin" },
 *   "font":       { "name": "Handwriting", "units_per_em": 1000 },
 *   "compiler":   { "engine": "truetype" },
 *   "template":   { "raster_scale": 1.0 },
 *   "pipeline":   { "workers": 0 }
 * }
 * @endcode
 *
 * Every key is optional; missing keys keep the defaults of default_config().
 *
 * @section config_overrides Character Overrides
 *
 * A single character can replace the scale factor and/or the vertical offset
 * of its class, either under @c overrides of a class section or in a separate
 * overrides file (load_character_overrides()) keyed by the character itself:
 *
 * @code{.json}
 * { "g": { "vertical_offset": -150 }, "Q": { "scale_factor": 3.6 } }
 * @endcode
 *
 * Fields an override leaves out fall back to the class. Entries from an
 * overrides file are merged over those of the configuration.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/layout.hh>
#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace inkfont {
    /**
     * @brief Scale and vertical placement of one character class.
     */
    struct INKFONT_EXPORT scale_entry {
        double scale_factor = 1.0;     ///< Design units per source pixel (before pixels_per_unit)
        double vertical_offset = 0.0;  ///< Design units added after baseline alignment
    };

    /// Per-character replacement of some fields of its class's scale_entry.
    struct INKFONT_EXPORT scale_override {
        std::optional<double> scale_factor;
        std::optional<double> vertical_offset;

        /// Fields set in @p other replace those of this override.
        void merge(const scale_override& other) noexcept;

        bool operator==(const scale_override&) const = default;
    };

    /**
     * @brief Mapping from character class to scale_entry, with optional
     *        per-codepoint overrides.
     */
    class INKFONT_EXPORT scale_config {
    public:
        /// Defaults: upper 4.0, lower 2.8, digit 3.8, symbol 3.5; no offsets.
        scale_config();

        [[nodiscard]] const scale_entry& at(char_class cls) const noexcept;
        void set(char_class cls, const scale_entry& entry) noexcept;

        /// Class entry of @p cls with the override of @p codepoint applied, if any.
        [[nodiscard]] scale_entry resolve(char32_t codepoint, char_class cls) const;

        /// Merges @p entry into the override already held for @p codepoint.
        void set_override(char32_t codepoint, const scale_override& entry);

        [[nodiscard]] const scale_override* find_override(char32_t codepoint) const;
        [[nodiscard]] const std::map<char32_t, scale_override>& overrides() const noexcept { return m_overrides; }

    private:
        std::array<scale_entry, char_class_count> m_entries{};
        std::map<char32_t, scale_override> m_overrides;
    };

    enum class spacing_mode : uint8_t {
        proportional, ///< Bearings from the spacing table
        monospace     ///< Fixed advance, glyph centered in it
    };

    struct INKFONT_EXPORT spacing_entry {
        int left_bearing = 25;
        int right_bearing = 25;
        int min_advance = 250;  ///< Advance of an empty glyph
    };

    /**
     * @brief Per-class side bearings and the spacing mode.
     */
    struct INKFONT_EXPORT spacing_table {
        spacing_mode mode = spacing_mode::proportional;
        int monospace_advance = 600;
        std::array<spacing_entry, char_class_count> entries{};

        [[nodiscard]] const spacing_entry& at(char_class cls) const noexcept {
            return entries[static_cast<std::size_t>(cls)];
        }
    };

    /**
     * @brief Binarization parameters.
     *
     * The threshold is one global scalar applied to every cell. Faint strokes
     * in a badly lit cell can fall on the wrong side of it; that is a known
     * limitation of the template workflow.
     */
    struct INKFONT_EXPORT extraction_settings {
        int threshold = 140;      ///< Luminance strictly below is ink
        int min_ink_pixels = 20;  ///< At scale 1; fewer ink pixels means an empty cell
    };

    enum class tracer_kind : uint8_t {
        builtin, ///< pixel_edge_tracer
        potrace  ///< external potrace executable
    };

    struct INKFONT_EXPORT tracing_settings {
        tracer_kind engine = tracer_kind::builtin;
        std::string executable = "potrace";
        std::string turnpolicy = "minority";
        double alphamax = 1.0;
        double opttolerance = 0.2;
    };

    /**
     * @brief Font design space.
     */
    struct INKFONT_EXPORT design_space {
        int units_per_em = 1000;
        int ascent = 800;
        int descent = 200;            ///< Positive distance below the baseline
        double pixels_per_unit = 1.0; ///< Source pixels (at scale 1) per design unit, before class scale
        double center_line = 500.0;   ///< Horizontal center glyphs are aligned to
    };

    struct INKFONT_EXPORT font_settings {
        std::string name = "Handwriting";
        std::string version = "1.0";
        std::string copyright = "Generated by inkfont";
        int space_width = 500;
    };

    enum class compiler_kind : uint8_t {
        truetype, ///< truetype_compiler (built in)
        fontforge ///< external fontforge executable
    };

    struct INKFONT_EXPORT compiler_settings {
        compiler_kind engine = compiler_kind::truetype;
        std::string executable = "fontforge";
    };

    struct INKFONT_EXPORT template_settings {
        double raster_scale = 1.0;
        int label_gray = 200;          ///< Must stay lighter than the threshold
        int guide_gray = 225;          ///< Must stay lighter than the threshold
        std::filesystem::path label_font;
        float label_size = 14.0f;
    };

    struct INKFONT_EXPORT pipeline_settings {
        unsigned workers = 0;                 ///< 0 = hardware concurrency
        std::filesystem::path work_root;      ///< Empty = system temp directory
        bool keep_intermediates = false;
    };

    /**
     * @brief Complete job configuration.
     */
    struct INKFONT_EXPORT generator_config {
        grid_layout grid;
        scale_config scales;
        spacing_table spacing;
        extraction_settings extraction;
        tracing_settings tracing;
        design_space design;
        font_settings font;
        compiler_settings compiler;
        template_settings templ;
        pipeline_settings pipeline;
    };

    [[nodiscard]] INKFONT_EXPORT generator_config default_config();

    /**
     * @brief Parse a JSON configuration document.
     * @throws config_error on malformed JSON, wrong value types or invalid values
     */
    [[nodiscard]] INKFONT_EXPORT generator_config parse_config(std::string_view json);

    /**
     * @brief Load a configuration file.
     *
     * A missing file yields default_config().
     *
     * @throws config_error if the file exists but cannot be read or parsed
     */
    [[nodiscard]] INKFONT_EXPORT generator_config load_config(const std::filesystem::path& path);

    /**
     * @brief Parse a character overrides document into @p scales.
     *
     * The document maps single characters to objects with optional
     * @c scale_factor and @c vertical_offset members.
     *
     * @throws config_error on malformed JSON, keys that are not exactly one
     *         character, or wrongly typed values
     */
    INKFONT_EXPORT void parse_character_overrides(std::string_view json, scale_config& scales);

    /**
     * @brief Load a character overrides file into @p config.
     *
     * A missing file is reported as a warning and leaves @p config unchanged.
     *
     * @throws config_error if the file exists but cannot be parsed, or the
     *         merged configuration is invalid
     */
    INKFONT_EXPORT void load_character_overrides(const std::filesystem::path& path, generator_config& config);

    /// @throws config_error on values no stage can work with
    INKFONT_EXPORT void validate(const generator_config& config);
} // namespace inkfont
