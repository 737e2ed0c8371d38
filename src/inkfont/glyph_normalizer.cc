//
// Created by igor on 19/10/2026.
//

#include <inkfont/glyph_normalizer.hh>
#include <cmath>

namespace inkfont {
    namespace {
        point round_point(point p) {
            return {std::round(p.x), std::round(p.y)};
        }

        contour rounded(const contour& c) {
            contour out;
            out.start = round_point(c.start);
            out.segments.reserve(c.segments.size());
            for (const auto& s : c.segments) {
                segment r = s;
                r.to = round_point(s.to);
                if (s.kind != segment_kind::line) {
                    r.c1 = round_point(s.c1);
                }
                if (s.kind == segment_kind::cubic) {
                    r.c2 = round_point(s.c2);
                }
                out.segments.push_back(r);
            }
            return out;
        }
    }

    affine flip_to_font_space() noexcept {
        return {1.0, 0.0, 0.0, -1.0, 0.0, 0.0};
    }

    glyph_outline translated(const glyph_outline& outline, double dx, double dy) {
        glyph_outline out;
        out.contours.reserve(outline.contours.size());
        const affine t = affine::translate(dx, dy);
        for (const auto& c : outline.contours) {
            out.contours.push_back(transformed(c, t));
        }
        return out;
    }

    glyph_normalizer::glyph_normalizer(const scale_config& scales, const design_space& design)
        : m_scales(scales), m_design(design) {
    }

    scale_entry glyph_normalizer::entry_for(const character_spec& spec) const {
        return m_scales.resolve(spec.codepoint, spec.cls);
    }

    double glyph_normalizer::unit_scale(const scale_entry& entry, double resolution_scale) const noexcept {
        return entry.scale_factor / (m_design.pixels_per_unit * resolution_scale);
    }

    double glyph_normalizer::unit_scale(const character_spec& spec, double resolution_scale) const {
        return unit_scale(entry_for(spec), resolution_scale);
    }

    double glyph_normalizer::unit_scale(char_class cls, double resolution_scale) const noexcept {
        return unit_scale(m_scales.at(cls), resolution_scale);
    }

    affine glyph_normalizer::transform_for(const raw_path& path, const cell_frame& frame,
                                           const scale_entry& entry) const {
        const bbox ink = curve_bounds(path.contours);
        const double center_x = ink.valid ? ink.center().x : 0.0;

        const affine anchor = affine::translate(-center_x, -frame.baseline_y);
        const affine scale = affine::scale(unit_scale(entry, frame.scale));
        const affine place = affine::translate(m_design.center_line, entry.vertical_offset);

        return anchor.then(scale).then(flip_to_font_space()).then(place);
    }

    affine glyph_normalizer::transform_for(const raw_path& path, const cell_frame& frame,
                                           const character_spec& spec) const {
        return transform_for(path, frame, entry_for(spec));
    }

    affine glyph_normalizer::transform_for(const raw_path& path, const cell_frame& frame, char_class cls) const {
        return transform_for(path, frame, m_scales.at(cls));
    }

    glyph_outline glyph_normalizer::normalize(const raw_path& path, const cell_frame& frame,
                                              const scale_entry& entry) const {
        glyph_outline out;
        if (path.empty()) {
            return out;
        }

        const affine t = transform_for(path, frame, entry);
        for (const auto& c : path.contours) {
            contour mapped = rounded(transformed(c, t));
            // A tiny contour can round to a line or a point.
            if (signed_area(mapped) != 0.0) {
                out.contours.push_back(std::move(mapped));
            }
        }
        return out;
    }

    glyph_outline glyph_normalizer::normalize(const raw_path& path, const cell_frame& frame,
                                              const character_spec& spec) const {
        return normalize(path, frame, entry_for(spec));
    }

    glyph_outline glyph_normalizer::normalize(const raw_path& path, const cell_frame& frame, char_class cls) const {
        return normalize(path, frame, m_scales.at(cls));
    }
}  // namespace inkfont
