/**
 * @file font_generator.hh
 * @brief The whole template to font pipeline behind one call.
 *
 * @section generator_flow Flow
 *
 * @code
 *   fit_rows + validate(grid, set)        layout_error      once, no image work
 *   region_extractor::prepare(image)      extraction_error  once, before cropping
 *   parallel_map over cells:
 *       extract -> vectorize -> normalize -> measure
 *   join; cancelled?                      cancelled_error   nothing written
 *   font_assembler::assemble + emit       assembly_error    output untouched
 * @endcode
 *
 * Workers share only the read-only configuration and write to their own
 * result slot, so the per-cell stages take no locks. Cancellation is
 * observed between cells.
 *
 * Each job works in its own directory (mkdtemp under pipeline.work_root);
 * per-cell files are named after the cell index and codepoint, e.g.
 * @c cell_004_U+0045.pbm. The directory is removed when the job ends unless
 * pipeline.keep_intermediates is set, in which case cell bitmaps are also
 * saved as PNG.
 *
 * @section generator_example Example
 *
 * @code{.cpp}
 * font_generator generator(load_config("inkfont.json"));
 * const auto set = character_set::standard();
 * generator.write_template(set, "template.svg", "template.png");
 * // ... the user fills in template.png ...
 * generation_result r = generator.generate("scan.png", set, "Handwriting.ttf");
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/compile/font_compiler.hh>
#include <inkfont/config.hh>
#include <inkfont/font_assembler.hh>
#include <inkfont/image.hh>
#include <inkfont/layout.hh>
#include <inkfont/tracing/trace_engine.hh>
#include <inkfont/utils/parallel.hh>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace inkfont {
    /// What happened to one character.
    struct INKFONT_EXPORT glyph_report {
        char32_t codepoint = 0;
        std::size_t cell_index = 0;
        glyph_status status = glyph_status::empty;
        std::size_t ink_pixels = 0;
        std::string failure;
    };

    struct INKFONT_EXPORT generation_result {
        std::filesystem::path output;
        std::vector<glyph_report> glyphs;  ///< In cell order

        [[nodiscard]] std::size_t count(glyph_status status) const noexcept;
    };

    /// Unique per-cell file stem within a job directory.
    [[nodiscard]] INKFONT_EXPORT std::string cell_stem(const character_spec& spec);

    class INKFONT_EXPORT font_generator {
    public:
        /**
         * @brief Generator with the engines selected by the configuration.
         * @throws config_error if the configuration is invalid
         */
        explicit font_generator(generator_config config);

        /// Generator with explicit engines (tests use deterministic fakes).
        font_generator(generator_config config, std::unique_ptr<trace_engine> tracer,
                       std::unique_ptr<font_compiler> compiler);

        /**
         * @brief Run the pipeline on a decoded source image.
         *
         * @throws layout_error, extraction_error, assembly_error, cancelled_error
         * @throws std::runtime_error if the job directory cannot be created
         */
        [[nodiscard]] generation_result generate(const gray_image& source, const character_set& set,
                                                 const std::filesystem::path& output,
                                                 const cancellation_token& cancel = cancellation_token{}) const;

        /// Same, decoding @p source_path first (extraction_error if unreadable).
        [[nodiscard]] generation_result generate(const std::filesystem::path& source_path, const character_set& set,
                                                 const std::filesystem::path& output,
                                                 const cancellation_token& cancel = cancellation_token{}) const;

        /**
         * @brief Write the blank template for @p set.
         *
         * Either path may be empty to skip that format.
         *
         * @throws layout_error if the grid cannot hold the set
         * @throws std::runtime_error on I/O failure
         */
        void write_template(const character_set& set, const std::filesystem::path& svg_path,
                            const std::filesystem::path& png_path) const;

        [[nodiscard]] const generator_config& config() const noexcept { return m_config; }
        [[nodiscard]] const trace_engine& tracer() const noexcept { return *m_tracer; }
        [[nodiscard]] const font_compiler& compiler() const noexcept { return *m_compiler; }

    private:
        generator_config m_config;
        std::unique_ptr<trace_engine> m_tracer;
        std::unique_ptr<font_compiler> m_compiler;
    };
} // namespace inkfont
