//
// Created by igor on 19/10/2026.
//

#include <inkfont/geometry.hh>
#include <algorithm>
#include <cmath>

namespace inkfont {
    namespace {
        point lerp(point p, point q, double t) {
            return {p.x + (q.x - p.x) * t, p.y + (q.y - p.y) * t};
        }

        point eval_quad(point p0, point c, point p1, double t) {
            const double u = 1.0 - t;
            return {
                u * u * p0.x + 2.0 * u * t * c.x + t * t * p1.x,
                u * u * p0.y + 2.0 * u * t * c.y + t * t * p1.y
            };
        }

        point eval_cubic(point p0, point c1, point c2, point p1, double t) {
            const double u = 1.0 - t;
            const double uu = u * u;
            const double tt = t * t;
            return {
                uu * u * p0.x + 3.0 * uu * t * c1.x + 3.0 * u * tt * c2.x + tt * t * p1.x,
                uu * u * p0.y + 3.0 * uu * t * c1.y + 3.0 * u * tt * c2.y + tt * t * p1.y
            };
        }

        // Parameters in (0, 1) where a*t^2 + b*t + c changes sign.
        int unit_roots(double a, double b, double c, double out[2]) {
            int n = 0;
            auto keep = [&](double t) {
                if (t > 0.0 && t < 1.0) {
                    out[n++] = t;
                }
            };
            if (std::fabs(a) < 1e-12) {
                if (std::fabs(b) > 1e-12) {
                    keep(-c / b);
                }
                return n;
            }
            const double disc = b * b - 4.0 * a * c;
            if (disc < 0.0) {
                return n;
            }
            const double root = std::sqrt(disc);
            keep((-b + root) / (2.0 * a));
            keep((-b - root) / (2.0 * a));
            return n;
        }

        // Derivative of a cubic Bezier coordinate, divided by 3.
        int cubic_extrema(double p0, double p1, double p2, double p3, double out[2]) {
            return unit_roots(-p0 + 3.0 * p1 - 3.0 * p2 + p3, 2.0 * (p0 - 2.0 * p1 + p2), p1 - p0, out);
        }
    }

    segment segment::line_to(point p) {
        return {segment_kind::line, {}, {}, p};
    }

    segment segment::quad_to(point c, point p) {
        return {segment_kind::quadratic, c, {}, p};
    }

    segment segment::cubic_to(point a, point b, point p) {
        return {segment_kind::cubic, a, b, p};
    }

    void bbox::include(point p) {
        if (!valid) {
            x_min = x_max = p.x;
            y_min = y_max = p.y;
            valid = true;
            return;
        }
        x_min = std::min(x_min, p.x);
        y_min = std::min(y_min, p.y);
        x_max = std::max(x_max, p.x);
        y_max = std::max(y_max, p.y);
    }

    void bbox::include(const bbox& other) {
        if (!other.valid) {
            return;
        }
        include(point{other.x_min, other.y_min});
        include(point{other.x_max, other.y_max});
    }

    affine affine::translate(double dx, double dy) {
        return {1.0, 0.0, 0.0, 1.0, dx, dy};
    }

    affine affine::scale(double s) {
        return {s, 0.0, 0.0, s, 0.0, 0.0};
    }

    affine affine::flip_y() {
        return {1.0, 0.0, 0.0, -1.0, 0.0, 0.0};
    }

    affine affine::then(const affine& next) const {
        // next * this
        return {
            next.a * a + next.c * b,
            next.b * a + next.d * b,
            next.a * c + next.c * d,
            next.b * c + next.d * d,
            next.a * tx + next.c * ty + next.tx,
            next.b * tx + next.d * ty + next.ty
        };
    }

    point affine::apply(point p) const {
        return {a * p.x + c * p.y + tx, b * p.x + d * p.y + ty};
    }

    std::size_t point_count(const contour& c) {
        return c.segments.size() + 1;
    }

    bbox control_bounds(const contour& c) {
        bbox box;
        box.include(c.start);
        for (const auto& s : c.segments) {
            switch (s.kind) {
                case segment_kind::cubic:
                    box.include(s.c2);
                    [[fallthrough]];
                case segment_kind::quadratic:
                    box.include(s.c1);
                    break;
                case segment_kind::line:
                    break;
            }
            box.include(s.to);
        }
        return box;
    }

    bbox control_bounds(std::span<const contour> contours) {
        bbox box;
        for (const auto& c : contours) {
            box.include(control_bounds(c));
        }
        return box;
    }

    bbox curve_bounds(const contour& c) {
        bbox box;
        box.include(c.start);
        point current = c.start;
        double t[2];
        for (const auto& s : c.segments) {
            switch (s.kind) {
                case segment_kind::line:
                    break;
                case segment_kind::quadratic: {
                    // Derivative of a quadratic coordinate, divided by 2, is linear.
                    const int nx = unit_roots(0.0, current.x - 2.0 * s.c1.x + s.to.x, s.c1.x - current.x, t);
                    for (int i = 0; i < nx; ++i) {
                        box.include(eval_quad(current, s.c1, s.to, t[i]));
                    }
                    const int ny = unit_roots(0.0, current.y - 2.0 * s.c1.y + s.to.y, s.c1.y - current.y, t);
                    for (int i = 0; i < ny; ++i) {
                        box.include(eval_quad(current, s.c1, s.to, t[i]));
                    }
                    break;
                }
                case segment_kind::cubic: {
                    const int nx = cubic_extrema(current.x, s.c1.x, s.c2.x, s.to.x, t);
                    for (int i = 0; i < nx; ++i) {
                        box.include(eval_cubic(current, s.c1, s.c2, s.to, t[i]));
                    }
                    const int ny = cubic_extrema(current.y, s.c1.y, s.c2.y, s.to.y, t);
                    for (int i = 0; i < ny; ++i) {
                        box.include(eval_cubic(current, s.c1, s.c2, s.to, t[i]));
                    }
                    break;
                }
            }
            box.include(s.to);
            current = s.to;
        }
        return box;
    }

    bbox curve_bounds(std::span<const contour> contours) {
        bbox box;
        for (const auto& c : contours) {
            box.include(curve_bounds(c));
        }
        return box;
    }

    std::vector<point> flatten(const contour& c, int steps) {
        std::vector<point> out;
        out.reserve(c.segments.size() + 1);
        out.push_back(c.start);

        point current = c.start;
        for (const auto& s : c.segments) {
            switch (s.kind) {
                case segment_kind::line:
                    out.push_back(s.to);
                    break;
                case segment_kind::quadratic:
                    for (int i = 1; i <= steps; ++i) {
                        out.push_back(eval_quad(current, s.c1, s.to, static_cast<double>(i) / steps));
                    }
                    break;
                case segment_kind::cubic:
                    for (int i = 1; i <= steps; ++i) {
                        out.push_back(eval_cubic(current, s.c1, s.c2, s.to, static_cast<double>(i) / steps));
                    }
                    break;
            }
            current = s.to;
        }

        if (out.size() > 1 && out.back() == out.front()) {
            out.pop_back();
        }
        return out;
    }

    double signed_area(const contour& c) {
        const auto pts = flatten(c);
        if (pts.size() < 3) {
            return 0.0;
        }
        double sum = 0.0;
        for (std::size_t i = 0; i < pts.size(); ++i) {
            const point& p = pts[i];
            const point& q = pts[(i + 1) % pts.size()];
            sum += p.x * q.y - q.x * p.y;
        }
        return sum / 2.0;
    }

    contour reversed(const contour& c) {
        if (c.segments.empty()) {
            return c;
        }

        // On-curve points in order; the implicit closing line is made explicit
        // so every segment has a well defined start.
        std::vector<point> starts;
        starts.reserve(c.segments.size() + 1);
        starts.push_back(c.start);
        for (const auto& s : c.segments) {
            starts.push_back(s.to);
        }

        contour out;
        const point last = c.segments.back().to;
        out.start = c.start;

        if (last != c.start) {
            out.segments.push_back(segment::line_to(last));
        }

        for (std::size_t i = c.segments.size(); i-- > 0;) {
            const segment& s = c.segments[i];
            const point from = starts[i];
            switch (s.kind) {
                case segment_kind::line:
                    out.segments.push_back(segment::line_to(from));
                    break;
                case segment_kind::quadratic:
                    out.segments.push_back(segment::quad_to(s.c1, from));
                    break;
                case segment_kind::cubic:
                    out.segments.push_back(segment::cubic_to(s.c2, s.c1, from));
                    break;
            }
        }
        return out;
    }

    contour transformed(const contour& c, const affine& t) {
        contour out;
        out.start = t.apply(c.start);
        out.segments.reserve(c.segments.size());
        for (const auto& s : c.segments) {
            segment n = s;
            n.to = t.apply(s.to);
            if (s.kind != segment_kind::line) {
                n.c1 = t.apply(s.c1);
            }
            if (s.kind == segment_kind::cubic) {
                n.c2 = t.apply(s.c2);
            }
            out.segments.push_back(n);
        }
        return out;
    }

    bool contains(const contour& c, point p) {
        const auto pts = flatten(c);
        bool inside = false;
        for (std::size_t i = 0, j = pts.size() - 1; i < pts.size(); j = i++) {
            const point& a = pts[i];
            const point& b = pts[j];
            if ((a.y > p.y) != (b.y > p.y)) {
                const double x = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
                if (p.x < x) {
                    inside = !inside;
                }
            }
        }
        return inside;
    }

    point sample_point(const contour& c) {
        if (c.segments.empty()) {
            return c.start;
        }
        const segment& s = c.segments.front();
        switch (s.kind) {
            case segment_kind::line: {
                const double len = std::hypot(s.to.x - c.start.x, s.to.y - c.start.y);
                if (len <= 0.0) {
                    return c.start;
                }
                return lerp(c.start, s.to, std::min(0.5, len / 2.0) / len);
            }
            case segment_kind::quadratic:
                return eval_quad(c.start, s.c1, s.to, 0.5);
            case segment_kind::cubic:
                return eval_cubic(c.start, s.c1, s.c2, s.to, 0.5);
        }
        return c.start;
    }
}  // namespace inkfont
