/**
 * @file potrace_svg.hh
 * @brief Read the SVG documents written by potrace back into contours.
 *
 * potrace --svg writes one group whose transform maps its internal,
 * y-up, tenth-of-a-pixel coordinates onto the bitmap:
 *
 * @code{.xml}
 * <svg ... width="40pt" height="30pt" viewBox="0 0 40 30">
 * <g transform="translate(0.000000,30.000000) scale(0.100000,-0.100000)"
 *    fill="#000000" stroke="none">
 * <path d="M120 250 c-30 -40 -60 -90 -60 -120 l0 -80 z m40 -60 ..."/>
 * </g>
 * </svg>
 * @endcode
 *
 * The parser applies the group transform and the viewBox so the returned
 * contours are in bitmap pixel space (origin top-left, y down), like every
 * other trace engine.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/geometry.hh>
#include <inkfont/tracing/trace_engine.hh>
#include <string_view>
#include <vector>

namespace inkfont {
    /**
     * @brief Parse an SVG transform list (translate, scale, matrix).
     * @throws tracing_failure on unknown functions or bad numbers
     */
    [[nodiscard]] INKFONT_EXPORT affine parse_svg_transform(std::string_view text);

    /**
     * @brief Parse SVG path data into contours.
     *
     * Supports M m L l H h V v C c Q q Z z with implicit command repetition.
     *
     * @throws tracing_failure on malformed data or unsupported commands
     */
    [[nodiscard]] INKFONT_EXPORT std::vector<contour> parse_svg_path(std::string_view data);

    /**
     * @brief Parse a complete potrace SVG document.
     *
     * @param width Width of the traced bitmap in pixels
     * @param height Height of the traced bitmap in pixels
     * @throws tracing_failure if the document is not a potrace SVG
     */
    [[nodiscard]] INKFONT_EXPORT raw_path parse_potrace_svg(std::string_view svg, int width, int height);
} // namespace inkfont
