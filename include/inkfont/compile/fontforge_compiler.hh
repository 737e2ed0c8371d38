/**
 * @file fontforge_compiler.hh
 * @brief Font compiler backed by the external FontForge executable.
 *
 * The document is written as a FontForge SFD file and FontForge generates
 * the TrueType binary from it:
 *
 * @code
 *   <work>/font.sfd --fontforge -lang=ff -c 'Open($1); Generate($2)'--> <work>/font.ttf
 * @endcode
 *
 * @c work is the job directory of the compile_job, or a private temporary
 * directory when the job has none. The generated file is then copied to the
 * requested output path. SFD
 * splines are PostScript ordered (cubic, outer contours counter-clockwise),
 * so contours are written reversed and quadratic segments are raised to
 * cubic ones.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/compile/font_compiler.hh>
#include <string>
#include <vector>

namespace inkfont {
    class INKFONT_EXPORT fontforge_compiler final : public font_compiler {
    public:
        explicit fontforge_compiler(compiler_settings settings);

        using font_compiler::compile;
        void compile(const font_document& doc, const std::filesystem::path& output,
                     const compile_job& job) const override;
        [[nodiscard]] std::string_view name() const noexcept override { return "fontforge"; }

        [[nodiscard]] std::vector<std::string> command(const std::string& sfd, const std::string& output) const;

    private:
        compiler_settings m_settings;
    };

    /// SplineFontDB 3.0 text of the document.
    [[nodiscard]] INKFONT_EXPORT std::string to_sfd(const font_document& doc);
} // namespace inkfont
