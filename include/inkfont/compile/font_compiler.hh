/**
 * @file font_compiler.hh
 * @brief Capability interface for turning a font_document into a font binary.
 *
 * The assembler only ever talks to this interface, so tests substitute a
 * deterministic fake and the external engine stays optional:
 *
 * | Engine             | Output            | Needs            |
 * |--------------------|-------------------|------------------|
 * | truetype_compiler  | TrueType (glyf)   | nothing          |
 * | fontforge_compiler | TrueType          | fontforge on PATH|
 *
 * A compiler writes exactly one file at the path it is given. It does not
 * need to be atomic; font_assembler::emit() hands it a temporary path and
 * renames the result. Scratch files go into the job directory of the
 * compile_job when there is one, so they land under pipeline.work_root and
 * are kept with the other intermediates.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/config.hh>
#include <inkfont/font_document.hh>
#include <filesystem>
#include <memory>
#include <string_view>

namespace inkfont {
    class work_directory;

    /// Context of one compilation.
    struct INKFONT_EXPORT compile_job {
        const work_directory* work = nullptr;  ///< Job scratch directory; null = compiler makes its own
    };

    class INKFONT_EXPORT font_compiler {
    public:
        virtual ~font_compiler();

        /**
         * @brief Serialize @p doc into a font file at @p output.
         * @throws assembly_error when the engine fails
         */
        virtual void compile(const font_document& doc, const std::filesystem::path& output,
                             const compile_job& job) const = 0;

        /// Same, without a job directory.
        void compile(const font_document& doc, const std::filesystem::path& output) const {
            compile(doc, output, compile_job{});
        }

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    };

    /// Compiler selected by the compiler settings.
    [[nodiscard]] INKFONT_EXPORT std::unique_ptr<font_compiler> make_font_compiler(const compiler_settings& settings);
} // namespace inkfont
