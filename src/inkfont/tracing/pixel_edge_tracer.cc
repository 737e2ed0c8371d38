//
// Created by igor on 19/10/2026.
//

#include <inkfont/tracing/pixel_edge_tracer.hh>
#include <inkfont/errors.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/enforce.hh>
#include <array>
#include <cstddef>
#include <vector>

namespace inkfont {
    namespace {
        enum class dir : uint8_t { right, down, left, up };

        struct edge {
            int x0, y0;
            dir d;
            bool used = false;
        };

        // Clockwise on screen (y down).
        dir turn_right(dir d) {
            return static_cast<dir>((static_cast<int>(d) + 1) % 4);
        }

        std::pair<int, int> step(int x, int y, dir d) {
            switch (d) {
                case dir::right: return {x + 1, y};
                case dir::down: return {x, y + 1};
                case dir::left: return {x - 1, y};
                case dir::up: return {x, y - 1};
            }
            return {x, y};
        }

        class edge_graph {
        public:
            explicit edge_graph(const ink_bitmap& bits)
                : m_w(bits.width() + 1),
                  m_out(static_cast<std::size_t>(bits.width() + 1) * static_cast<std::size_t>(bits.height() + 1),
                        {-1, -1}) {
                for (int y = 0; y < bits.height(); ++y) {
                    for (int x = 0; x < bits.width(); ++x) {
                        if (!bits.ink_at(x, y)) {
                            continue;
                        }
                        if (!bits.ink_at(x, y - 1)) add(x, y, dir::right);
                        if (!bits.ink_at(x + 1, y)) add(x + 1, y, dir::down);
                        if (!bits.ink_at(x, y + 1)) add(x + 1, y + 1, dir::left);
                        if (!bits.ink_at(x - 1, y)) add(x, y + 1, dir::up);
                    }
                }
            }

            [[nodiscard]] std::size_t size() const noexcept { return m_edges.size(); }
            [[nodiscard]] edge& at(std::size_t i) { return m_edges[i]; }

            // Successor of edge @p from. At a vertex shared by two loops the
            // right turn is taken, which pairs incoming and outgoing edges
            // one to one.
            [[nodiscard]] int next(std::size_t from) const {
                const edge& e = m_edges[from];
                const auto [x, y] = step(e.x0, e.y0, e.d);
                const auto& slots = m_out[vertex(x, y)];

                int other = -1;
                for (int idx : slots) {
                    if (idx < 0) {
                        continue;
                    }
                    if (m_edges[static_cast<std::size_t>(idx)].d == turn_right(e.d)) {
                        return idx;
                    }
                    other = idx;
                }
                return other;
            }

        private:
            [[nodiscard]] std::size_t vertex(int x, int y) const noexcept {
                return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(x);
            }

            void add(int x, int y, dir d) {
                auto& slots = m_out[vertex(x, y)];
                const int idx = static_cast<int>(m_edges.size());
                m_edges.push_back({x, y, d});
                // A vertex has at most two outgoing boundary edges.
                ENFORCE(slots[0] < 0 || slots[1] < 0);
                (slots[0] < 0 ? slots[0] : slots[1]) = idx;
            }

            int m_w;
            std::vector<edge> m_edges;
            std::vector<std::array<int, 2>> m_out;
        };

        // Keep only the corners of a closed loop of unit edges.
        contour to_contour(const std::vector<std::pair<point, dir>>& loop) {
            std::vector<point> corners;
            const std::size_t n = loop.size();
            for (std::size_t i = 0; i < n; ++i) {
                const dir incoming = loop[(i + n - 1) % n].second;
                if (loop[i].second != incoming) {
                    corners.push_back(loop[i].first);
                }
            }

            contour c;
            c.start = corners.front();
            for (std::size_t i = 1; i < corners.size(); ++i) {
                c.segments.push_back(segment::line_to(corners[i]));
            }
            return c;
        }
    }

    raw_path pixel_edge_tracer::trace(const ink_bitmap& bits, const trace_job&) const {
        raw_path out;
        out.width = bits.width();
        out.height = bits.height();

        edge_graph graph(bits);
        for (std::size_t first = 0; first < graph.size(); ++first) {
            if (graph.at(first).used) {
                continue;
            }

            std::vector<std::pair<point, dir>> loop;
            std::size_t current = first;
            do {
                edge& e = graph.at(current);
                THROW_IF(e.used, tracing_failure,
                         "pixel boundary walk from (", graph.at(first).x0, ",", graph.at(first).y0,
                         ") did not close");
                e.used = true;
                loop.emplace_back(point{static_cast<double>(e.x0), static_cast<double>(e.y0)}, e.d);

                const int nxt = graph.next(current);
                THROW_IF(nxt < 0, tracing_failure,
                         "pixel boundary walk from (", graph.at(first).x0, ",", graph.at(first).y0,
                         ") reached a dead end");
                current = static_cast<std::size_t>(nxt);
            } while (current != first);

            out.contours.push_back(to_contour(loop));
        }
        return out;
    }
}  // namespace inkfont
