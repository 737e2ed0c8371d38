/**
 * @file vectorization_adapter.hh
 * @brief Run a trace engine and make its output safe to use.
 *
 * Whatever the engine returns, the adapter hands on a raw_path that
 *
 * - contains no degenerate contour (fewer than three distinct points, or an
 *   absolute area below half a square pixel);
 * - follows one winding convention: contours at even nesting depth (ink)
 *   have positive signed_area() in pixel space, contours at odd depth
 *   (holes) negative. Once the normalizer flips y, ink contours run
 *   clockwise in the font's y-up space, as TrueType expects.
 *
 * A tracing_failure never leaves the adapter. It is logged and the cell
 * continues as an empty path, so one bad drawing cannot abort a font.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/tracing/trace_engine.hh>
#include <string>

namespace inkfont {
    /// Adapter result: a clean path, or an empty one with the failure reason.
    struct INKFONT_EXPORT vectorized {
        raw_path path;
        bool failed = false;
        std::string failure;
    };

    class INKFONT_EXPORT vectorization_adapter {
    public:
        /// @p engine must outlive the adapter.
        explicit vectorization_adapter(const trace_engine& engine) noexcept;

        [[nodiscard]] vectorized vectorize(const ink_bitmap& bits, const trace_job& job) const;

        [[nodiscard]] const trace_engine& engine() const noexcept { return *m_engine; }

    private:
        const trace_engine* m_engine;
    };

    /// Remove contours with fewer than three distinct points or |area| < 0.5.
    [[nodiscard]] INKFONT_EXPORT raw_path strip_degenerate(raw_path path);

    /// Reorient every contour by its nesting depth (see file description).
    [[nodiscard]] INKFONT_EXPORT raw_path normalize_winding(raw_path path);

    /// Number of other contours of @p path enclosing contour @p index.
    [[nodiscard]] INKFONT_EXPORT int nesting_depth(const raw_path& path, std::size_t index);
} // namespace inkfont
