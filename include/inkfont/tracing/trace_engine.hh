/**
 * @file trace_engine.hh
 * @brief Capability interface of a bitmap-to-outline tracer.
 *
 * A trace engine turns the ink bitmap of one cell into closed contours in the
 * bitmap's own pixel space (origin top-left, y down). Engines make no promise
 * about winding or degenerate contours; the vectorization adapter cleans
 * their output.
 *
 * | Engine            | Output                        | Needs            |
 * |-------------------|-------------------------------|------------------|
 * | pixel_edge_tracer | exact pixel boundary polygons | nothing          |
 * | potrace_tracer    | smooth cubic Bezier contours  | potrace on PATH  |
 *
 * Tests substitute their own engine by deriving from trace_engine.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/config.hh>
#include <inkfont/geometry.hh>
#include <inkfont/utils/ink_bitmap.hh>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace inkfont {
    class work_directory;

    /**
     * @brief Traced outline of one cell in pixel space.
     */
    struct INKFONT_EXPORT raw_path {
        std::vector<contour> contours;
        int width = 0;    ///< Bitmap width the coordinates refer to
        int height = 0;   ///< Bitmap height the coordinates refer to

        [[nodiscard]] bool empty() const noexcept { return contours.empty(); }
    };

    /**
     * @brief Per-cell context handed to an engine.
     */
    struct INKFONT_EXPORT trace_job {
        const work_directory* work = nullptr;  ///< Scratch directory, may be null
        std::string stem = "cell";             ///< Unique file stem for this cell within @c work
    };

    class INKFONT_EXPORT trace_engine {
    public:
        virtual ~trace_engine();

        /**
         * @brief Trace every ink region of @p bits.
         * @throws tracing_failure when the engine fails or produces unusable output
         */
        [[nodiscard]] virtual raw_path trace(const ink_bitmap& bits, const trace_job& job) const = 0;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    };

    /// Engine selected by the tracing settings.
    [[nodiscard]] INKFONT_EXPORT std::unique_ptr<trace_engine> make_trace_engine(const tracing_settings& settings);
} // namespace inkfont
