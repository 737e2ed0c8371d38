/**
 * @file errors.hh
 * @brief Exception taxonomy of the glyph assembly pipeline.
 *
 * Structural failures (layout, extraction, assembly, configuration) always
 * propagate to the caller. Per-cell tracing failures are contained inside the
 * vectorization adapter and degrade to an empty glyph.
 *
 * | Exception | Raised when | Fatal |
 * |-----------|-------------|-------|
 * | layout_error | grid geometry or character set is inconsistent | yes |
 * | extraction_error | source image does not fit the grid | yes |
 * | tracing_failure | tracing engine failed for one cell | no |
 * | assembly_error | font emission failed or a glyph is missing | yes |
 * | config_error | configuration document is malformed | yes |
 * | cancelled_error | a running job was cancelled | yes |
 *
 * All exceptions are normally thrown through the failsafe macros:
 *
 * @code{.cpp}
 * THROW_IF(cell_index >= capacity, layout_error,
 *          "cell index ", cell_index, " exceeds grid capacity ", capacity);
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <stdexcept>
#include <string>

namespace inkfont {
    /**
     * @brief Base class of every error raised by inkfont.
     */
    class INKFONT_EXPORT inkfont_error : public std::runtime_error {
    public:
        explicit inkfont_error(const std::string& what);
        ~inkfont_error() override;
    };

    /// Grid or geometry misconfiguration. Raised before any image work.
    class INKFONT_EXPORT layout_error : public inkfont_error {
    public:
        using inkfont_error::inkfont_error;
    };

    /// Source image incompatible with the expected grid. Reported once per job.
    class INKFONT_EXPORT extraction_error : public inkfont_error {
    public:
        using inkfont_error::inkfont_error;
    };

    /**
     * @brief Tracing engine failure for a single cell.
     *
     * Never escapes the pipeline: the vectorization adapter logs it and
     * replaces the cell's path with an empty one.
     */
    class INKFONT_EXPORT tracing_failure : public inkfont_error {
    public:
        using inkfont_error::inkfont_error;
    };

    /// Font emission failed, or a character has no glyph entry.
    class INKFONT_EXPORT assembly_error : public inkfont_error {
    public:
        using inkfont_error::inkfont_error;
    };

    /// Malformed configuration document or invalid configuration values.
    class INKFONT_EXPORT config_error : public inkfont_error {
    public:
        using inkfont_error::inkfont_error;
    };

    /// A job observed its cancellation token between cells.
    class INKFONT_EXPORT cancelled_error : public inkfont_error {
    public:
        using inkfont_error::inkfont_error;
    };
} // namespace inkfont
