//
// Created by igor on 19/10/2026.
//

#include <inkfont/tracing/vectorization_adapter.hh>
#include <inkfont/errors.hh>
#include <failsafe/logger.hh>
#include <algorithm>
#include <cmath>

namespace inkfont {
    namespace {
        constexpr double MIN_AREA = 0.5;

        std::size_t distinct_points(const contour& c) {
            std::vector<point> pts = flatten(c);
            std::sort(pts.begin(), pts.end(), [](const point& a, const point& b) {
                return a.x < b.x || (a.x == b.x && a.y < b.y);
            });
            return static_cast<std::size_t>(std::unique(pts.begin(), pts.end()) - pts.begin());
        }
    }

    vectorization_adapter::vectorization_adapter(const trace_engine& engine) noexcept
        : m_engine(&engine) {
    }

    vectorized vectorization_adapter::vectorize(const ink_bitmap& bits, const trace_job& job) const {
        vectorized out;
        try {
            out.path = m_engine->trace(bits, job);
        } catch (const tracing_failure& e) {
            LOG_WARN("tracing ", job.stem, " with ", m_engine->name(), " failed: ", e.what());
            out.failed = true;
            out.failure = e.what();
            out.path = raw_path{{}, bits.width(), bits.height()};
            return out;
        }

        out.path = normalize_winding(strip_degenerate(std::move(out.path)));
        if (out.path.empty() && bits.ink_count() > 0) {
            LOG_DEBUG("tracing ", job.stem, " produced no usable contour");
        }
        return out;
    }

    raw_path strip_degenerate(raw_path path) {
        auto& cs = path.contours;
        cs.erase(std::remove_if(cs.begin(), cs.end(), [](const contour& c) {
            return distinct_points(c) < 3 || std::fabs(signed_area(c)) < MIN_AREA;
        }), cs.end());
        return path;
    }

    int nesting_depth(const raw_path& path, std::size_t index) {
        const point sample = sample_point(path.contours[index]);
        int depth = 0;
        for (std::size_t j = 0; j < path.contours.size(); ++j) {
            if (j != index && contains(path.contours[j], sample)) {
                ++depth;
            }
        }
        return depth;
    }

    raw_path normalize_winding(raw_path path) {
        std::vector<int> depths(path.contours.size());
        for (std::size_t i = 0; i < path.contours.size(); ++i) {
            depths[i] = nesting_depth(path, i);
        }
        for (std::size_t i = 0; i < path.contours.size(); ++i) {
            auto& c = path.contours[i];
            const bool outer = depths[i] % 2 == 0;
            const double area = signed_area(c);
            if ((outer && area < 0.0) || (!outer && area > 0.0)) {
                c = reversed(c);
            }
        }
        return path;
    }
}  // namespace inkfont
