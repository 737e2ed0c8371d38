/**
 * @file geometry.hh
 * @brief Outline primitives shared by the tracing, normalization and
 *        compilation stages.
 *
 * An outline is an ordered list of closed contours. Each contour starts at
 * an on-curve point and is a sequence of segments, each ending at the next
 * on-curve point. The closing segment back to the start is implicit when the
 * last segment does not already end there.
 *
 * @section geometry_coords Coordinate Systems
 *
 * The same types are used in two spaces:
 *
 * @code
 *   pixel space (raw_path)          design space (glyph_outline)
 *
 *   (0,0) +------> x                      y ^
 *         |                                 |   ink
 *         |   ink                           |
 *         v y                 baseline  ----+------> x
 * @endcode
 *
 * @section geometry_winding Winding
 *
 * signed_area() uses the shoelace formula on the raw coordinates. A positive
 * value is counter-clockwise in a y-up frame and clockwise on screen in a
 * y-down frame. Mirroring one axis flips the sign.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <cstdint>
#include <span>
#include <vector>

namespace inkfont {
    /// 2D point with double precision coordinates.
    struct INKFONT_EXPORT point {
        double x = 0.0;
        double y = 0.0;

        bool operator==(const point&) const = default;
    };

    /// Segment types understood by the whole pipeline.
    enum class segment_kind : uint8_t {
        line,      ///< Straight line to @c to
        quadratic, ///< Quadratic Bezier with control point @c c1
        cubic      ///< Cubic Bezier with control points @c c1 and @c c2
    };

    /**
     * @brief One segment of a contour.
     *
     * The start point is the end point of the previous segment (or the
     * contour start for the first one).
     */
    struct INKFONT_EXPORT segment {
        segment_kind kind = segment_kind::line;
        point c1;  ///< First control point (quadratic and cubic)
        point c2;  ///< Second control point (cubic only)
        point to;  ///< End point (on curve)

        [[nodiscard]] static segment line_to(point p);
        [[nodiscard]] static segment quad_to(point c, point p);
        [[nodiscard]] static segment cubic_to(point a, point b, point p);

        bool operator==(const segment&) const = default;
    };

    /// Closed contour.
    struct INKFONT_EXPORT contour {
        point start;
        std::vector<segment> segments;

        bool operator==(const contour&) const = default;
    };

    /**
     * @brief Axis-aligned bounding box.
     *
     * A default-constructed box is empty (inverted) and grows with include().
     */
    struct INKFONT_EXPORT bbox {
        double x_min = 0.0;
        double y_min = 0.0;
        double x_max = 0.0;
        double y_max = 0.0;
        bool valid = false;

        void include(point p);
        void include(const bbox& other);

        [[nodiscard]] double width() const noexcept { return valid ? x_max - x_min : 0.0; }
        [[nodiscard]] double height() const noexcept { return valid ? y_max - y_min : 0.0; }
        [[nodiscard]] point center() const noexcept {
            return {(x_min + x_max) / 2.0, (y_min + y_max) / 2.0};
        }
    };

    /**
     * @brief 2D affine transform.
     *
     * Maps (x, y) to (a*x + c*y + tx, b*x + d*y + ty). Transforms compose
     * left to right with then(): @c t1.then(t2) applies @c t1 first.
     */
    struct INKFONT_EXPORT affine {
        double a = 1.0;
        double b = 0.0;
        double c = 0.0;
        double d = 1.0;
        double tx = 0.0;
        double ty = 0.0;

        [[nodiscard]] static affine translate(double dx, double dy);
        [[nodiscard]] static affine scale(double s);
        /// Mirror across the x axis (y becomes -y).
        [[nodiscard]] static affine flip_y();

        [[nodiscard]] affine then(const affine& next) const;
        [[nodiscard]] point apply(point p) const;
        [[nodiscard]] bool mirrors() const noexcept { return a * d - b * c < 0.0; }
    };

    /// Number of on-curve points (start + one per segment).
    [[nodiscard]] INKFONT_EXPORT std::size_t point_count(const contour& c);

    /// Bounding box of every point of the contour, control points included.
    [[nodiscard]] INKFONT_EXPORT bbox control_bounds(const contour& c);
    [[nodiscard]] INKFONT_EXPORT bbox control_bounds(std::span<const contour> contours);

    /**
     * @brief Tight bounding box of the drawn curve.
     *
     * Control points count only through the extrema of their segments, so
     * the box never extends past the ink. Contained in control_bounds().
     */
    [[nodiscard]] INKFONT_EXPORT bbox curve_bounds(const contour& c);
    [[nodiscard]] INKFONT_EXPORT bbox curve_bounds(std::span<const contour> contours);

    /**
     * @brief Approximate the contour by a closed polyline.
     * @param steps Subdivisions per curved segment
     */
    [[nodiscard]] INKFONT_EXPORT std::vector<point> flatten(const contour& c, int steps = 16);

    /// Shoelace area of the flattened contour (see @ref geometry_winding).
    [[nodiscard]] INKFONT_EXPORT double signed_area(const contour& c);

    /// Same shape traversed in the opposite direction.
    [[nodiscard]] INKFONT_EXPORT contour reversed(const contour& c);

    [[nodiscard]] INKFONT_EXPORT contour transformed(const contour& c, const affine& t);

    /// Even-odd point containment against the flattened contour.
    [[nodiscard]] INKFONT_EXPORT bool contains(const contour& c, point p);

    /**
     * @brief A point strictly on the contour that no other contour of the
     *        same outline shares.
     *
     * Uses the middle of the first segment. Pixel-crack tracing can make two
     * contours touch at a corner, but never along an edge.
     */
    [[nodiscard]] INKFONT_EXPORT point sample_point(const contour& c);
} // namespace inkfont
