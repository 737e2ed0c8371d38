//
// Created by igor on 19/10/2026.
//

#include <inkfont/compile/truetype_compiler.hh>
#include <inkfont/errors.hh>
#include <inkfont/utils/utf8.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>

namespace inkfont {
    namespace {
        constexpr uint32_t CHECKSUM_MAGIC = 0xB1B0AFBA;
        constexpr uint32_t HEAD_MAGIC = 0x5F0F3CF5;

        constexpr uint8_t FLAG_ON_CURVE = 0x01;
        constexpr uint8_t FLAG_X_SHORT = 0x02;
        constexpr uint8_t FLAG_Y_SHORT = 0x04;
        constexpr uint8_t FLAG_REPEAT = 0x08;
        constexpr uint8_t FLAG_X_SAME_OR_POSITIVE = 0x10;
        constexpr uint8_t FLAG_Y_SAME_OR_POSITIVE = 0x20;

        class byte_writer {
        public:
            void u8(uint8_t v) { m_bytes.push_back(v); }
            void u16(uint16_t v) {
                u8(static_cast<uint8_t>(v >> 8));
                u8(static_cast<uint8_t>(v & 0xFF));
            }
            void i16(int v) { u16(static_cast<uint16_t>(static_cast<int16_t>(v))); }
            void u32(uint32_t v) {
                u16(static_cast<uint16_t>(v >> 16));
                u16(static_cast<uint16_t>(v & 0xFFFF));
            }
            void tag(std::string_view t) {
                for (std::size_t i = 0; i < 4; ++i) {
                    u8(static_cast<uint8_t>(i < t.size() ? t[i] : ' '));
                }
            }
            void bytes(const std::vector<uint8_t>& data) { m_bytes.insert(m_bytes.end(), data.begin(), data.end()); }
            void pad4() {
                while (m_bytes.size() % 4 != 0) {
                    m_bytes.push_back(0);
                }
            }
            void patch_u32(std::size_t at, uint32_t v) {
                m_bytes[at] = static_cast<uint8_t>(v >> 24);
                m_bytes[at + 1] = static_cast<uint8_t>(v >> 16);
                m_bytes[at + 2] = static_cast<uint8_t>(v >> 8);
                m_bytes[at + 3] = static_cast<uint8_t>(v);
            }

            [[nodiscard]] std::size_t size() const noexcept { return m_bytes.size(); }
            [[nodiscard]] const std::vector<uint8_t>& data() const noexcept { return m_bytes; }
            [[nodiscard]] std::vector<uint8_t> take() { return std::move(m_bytes); }

        private:
            std::vector<uint8_t> m_bytes;
        };

        struct tt_point {
            int x = 0;
            int y = 0;
            bool on_curve = true;
        };

        struct tt_glyph {
            std::vector<tt_point> points;
            std::vector<uint16_t> end_points;
            int x_min = 0;
            int y_min = 0;
            int x_max = 0;
            int y_max = 0;
            int advance = 0;
            int lsb = 0;

            [[nodiscard]] bool has_contours() const noexcept { return !end_points.empty(); }
        };

        int design_coord(double v, const glyph_entry& entry) {
            const long r = std::lround(v);
            THROW_IF(r < std::numeric_limits<int16_t>::min() || r > std::numeric_limits<int16_t>::max(),
                     assembly_error, "glyph ", entry.name, " has coordinate ", v, " outside the 16 bit range");
            return static_cast<int>(r);
        }

        tt_glyph build_glyph(const glyph_entry& entry) {
            tt_glyph g;
            g.advance = entry.metrics.advance_width;

            auto add = [&](point p, bool on_curve) {
                g.points.push_back({design_coord(p.x, entry), design_coord(p.y, entry), on_curve});
            };

            for (const auto& c : entry.outline.contours) {
                const std::size_t first = g.points.size();
                add(c.start, true);
                point cur = c.start;
                for (const auto& s : c.segments) {
                    switch (s.kind) {
                        case segment_kind::line:
                            add(s.to, true);
                            break;
                        case segment_kind::quadratic:
                            add(s.c1, false);
                            add(s.to, true);
                            break;
                        case segment_kind::cubic:
                            for (const auto& q : quadratic_approximation(cur, s)) {
                                add(q.c1, false);
                                add(q.to, true);
                            }
                            break;
                    }
                    cur = s.to;
                }
                // TrueType contours close implicitly.
                const tt_point& head = g.points[first];
                const tt_point& tail = g.points.back();
                if (g.points.size() - first > 1 && tail.on_curve && tail.x == head.x && tail.y == head.y) {
                    g.points.pop_back();
                }
                THROW_IF(g.points.size() > 0xFFFF, assembly_error, "glyph ", entry.name, " has too many points");
                g.end_points.push_back(static_cast<uint16_t>(g.points.size() - 1));
            }

            if (g.points.empty()) {
                g.lsb = entry.metrics.left_bearing;
                return g;
            }
            g.x_min = g.x_max = g.points.front().x;
            g.y_min = g.y_max = g.points.front().y;
            for (const auto& p : g.points) {
                g.x_min = std::min(g.x_min, p.x);
                g.y_min = std::min(g.y_min, p.y);
                g.x_max = std::max(g.x_max, p.x);
                g.y_max = std::max(g.y_max, p.y);
            }
            g.lsb = g.x_min;
            return g;
        }

        uint8_t point_flags(const tt_point& p, int dx, int dy) {
            uint8_t flags = p.on_curve ? FLAG_ON_CURVE : 0;
            if (dx == 0) {
                flags |= FLAG_X_SAME_OR_POSITIVE;
            } else if (dx >= -255 && dx <= 255) {
                flags |= FLAG_X_SHORT;
                if (dx > 0) {
                    flags |= FLAG_X_SAME_OR_POSITIVE;
                }
            }
            if (dy == 0) {
                flags |= FLAG_Y_SAME_OR_POSITIVE;
            } else if (dy >= -255 && dy <= 255) {
                flags |= FLAG_Y_SHORT;
                if (dy > 0) {
                    flags |= FLAG_Y_SAME_OR_POSITIVE;
                }
            }
            return flags;
        }

        void write_deltas(byte_writer& w, const std::vector<int>& deltas) {
            for (int d : deltas) {
                if (d == 0) {
                    continue;
                }
                if (d >= -255 && d <= 255) {
                    w.u8(static_cast<uint8_t>(std::abs(d)));
                } else {
                    w.i16(d);
                }
            }
        }

        std::vector<uint8_t> encode_glyph(const tt_glyph& g) {
            byte_writer w;
            if (!g.has_contours()) {
                return {};
            }
            w.i16(static_cast<int>(g.end_points.size()));
            w.i16(g.x_min);
            w.i16(g.y_min);
            w.i16(g.x_max);
            w.i16(g.y_max);
            for (uint16_t e : g.end_points) {
                w.u16(e);
            }
            w.u16(0);  // instructionLength

            std::vector<uint8_t> flags;
            std::vector<int> dxs;
            std::vector<int> dys;
            flags.reserve(g.points.size());
            int last_x = 0;
            int last_y = 0;
            for (const auto& p : g.points) {
                const int dx = p.x - last_x;
                const int dy = p.y - last_y;
                flags.push_back(point_flags(p, dx, dy));
                dxs.push_back(dx);
                dys.push_back(dy);
                last_x = p.x;
                last_y = p.y;
            }

            for (std::size_t i = 0; i < flags.size();) {
                std::size_t run = 1;
                while (i + run < flags.size() && flags[i + run] == flags[i] && run < 256) {
                    ++run;
                }
                if (run > 2) {
                    w.u8(flags[i] | FLAG_REPEAT);
                    w.u8(static_cast<uint8_t>(run - 1));
                } else {
                    for (std::size_t k = 0; k < run; ++k) {
                        w.u8(flags[i]);
                    }
                }
                i += run;
            }
            write_deltas(w, dxs);
            write_deltas(w, dys);
            w.pad4();
            return w.take();
        }

        struct font_tables {
            const font_document& doc;
            std::vector<tt_glyph> glyphs;
            std::vector<std::pair<uint16_t, uint16_t>> char_map;  // codepoint, glyph index
            int x_min = 0;
            int y_min = 0;
            int x_max = 0;
            int y_max = 0;
            int max_points = 0;
            int max_contours = 0;
        };

        font_tables collect(const font_document& doc) {
            font_tables t{doc, {}, {}};
            const auto order = doc.glyph_order();
            THROW_IF(order.size() > 0xFFFF, assembly_error, "too many glyphs: ", order.size());

            bool first_box = true;
            for (std::size_t i = 0; i < order.size(); ++i) {
                const glyph_entry& entry = *order[i];
                tt_glyph g = build_glyph(entry);
                if (g.has_contours()) {
                    if (first_box) {
                        t.x_min = g.x_min;
                        t.y_min = g.y_min;
                        t.x_max = g.x_max;
                        t.y_max = g.y_max;
                        first_box = false;
                    } else {
                        t.x_min = std::min(t.x_min, g.x_min);
                        t.y_min = std::min(t.y_min, g.y_min);
                        t.x_max = std::max(t.x_max, g.x_max);
                        t.y_max = std::max(t.y_max, g.y_max);
                    }
                    t.max_points = std::max(t.max_points, static_cast<int>(g.points.size()));
                    t.max_contours = std::max(t.max_contours, static_cast<int>(g.end_points.size()));
                }
                if (i > 0) {
                    THROW_IF(entry.codepoint > 0xFFFF, assembly_error,
                             codepoint_name(entry.codepoint), " is outside the Basic Multilingual Plane");
                    t.char_map.emplace_back(static_cast<uint16_t>(entry.codepoint), static_cast<uint16_t>(i));
                }
                t.glyphs.push_back(std::move(g));
            }
            return t;
        }

        uint32_t font_revision(const std::string& version) {
            const double v = std::strtod(version.c_str(), nullptr);
            const double clamped = v > 0.0 && v < 32767.0 ? v : 1.0;
            return static_cast<uint32_t>(std::lround(clamped * 65536.0));
        }

        std::vector<uint8_t> head_table(const font_tables& t) {
            byte_writer w;
            w.u16(1);
            w.u16(0);
            w.u32(font_revision(t.doc.info().version));
            w.u32(0);  // checkSumAdjustment, patched last
            w.u32(HEAD_MAGIC);
            w.u16(0x000B);  // baseline at y=0, lsb at x=0, integer scaling
            w.u16(static_cast<uint16_t>(t.doc.info().units_per_em));
            w.u32(0);  // created
            w.u32(0);
            w.u32(0);  // modified
            w.u32(0);
            w.i16(t.x_min);
            w.i16(t.y_min);
            w.i16(t.x_max);
            w.i16(t.y_max);
            w.u16(0);  // macStyle
            w.u16(8);  // lowestRecPPEM
            w.i16(2);  // fontDirectionHint
            w.i16(1);  // indexToLocFormat: long
            w.i16(0);
            return w.take();
        }

        std::vector<uint8_t> hhea_table(const font_tables& t) {
            int advance_max = 0;
            int min_lsb = 0;
            int min_rsb = 0;
            int max_extent = 0;
            bool first = true;
            for (const auto& g : t.glyphs) {
                advance_max = std::max(advance_max, g.advance);
                if (!g.has_contours()) {
                    continue;
                }
                const int rsb = g.advance - g.x_max;
                if (first) {
                    min_lsb = g.lsb;
                    min_rsb = rsb;
                    max_extent = g.x_max;
                    first = false;
                } else {
                    min_lsb = std::min(min_lsb, g.lsb);
                    min_rsb = std::min(min_rsb, rsb);
                    max_extent = std::max(max_extent, g.x_max);
                }
            }

            byte_writer w;
            w.u16(1);
            w.u16(0);
            w.i16(t.doc.info().ascent);
            w.i16(-t.doc.info().descent);
            w.i16(0);  // lineGap
            w.u16(static_cast<uint16_t>(advance_max));
            w.i16(min_lsb);
            w.i16(min_rsb);
            w.i16(max_extent);
            w.i16(1);  // caretSlopeRise
            w.i16(0);
            w.i16(0);
            for (int i = 0; i < 4; ++i) {
                w.i16(0);
            }
            w.i16(0);  // metricDataFormat
            w.u16(static_cast<uint16_t>(t.glyphs.size()));
            return w.take();
        }

        std::vector<uint8_t> maxp_table(const font_tables& t) {
            byte_writer w;
            w.u32(0x00010000);
            w.u16(static_cast<uint16_t>(t.glyphs.size()));
            w.u16(static_cast<uint16_t>(t.max_points));
            w.u16(static_cast<uint16_t>(t.max_contours));
            w.u16(0);  // maxCompositePoints
            w.u16(0);  // maxCompositeContours
            w.u16(2);  // maxZones
            for (int i = 0; i < 9; ++i) {
                w.u16(0);
            }
            return w.take();
        }

        int glyph_top(const font_document& doc, char32_t cp) {
            const glyph_entry* e = doc.find(cp);
            if (!e || e->outline.empty()) {
                return 0;
            }
            return static_cast<int>(std::lround(e->outline.bounds().y_max));
        }

        std::vector<uint8_t> os2_table(const font_tables& t) {
            const font_info& info = t.doc.info();
            const int upm = info.units_per_em;

            long advance_sum = 0;
            int advance_count = 0;
            for (const auto& g : t.glyphs) {
                if (g.advance > 0) {
                    advance_sum += g.advance;
                    ++advance_count;
                }
            }
            const int avg_width = advance_count ? static_cast<int>(advance_sum / advance_count) : 0;
            const auto scaled = [upm](double f) { return static_cast<int>(std::lround(upm * f)); };

            byte_writer w;
            w.u16(4);
            w.i16(avg_width);
            w.u16(400);  // usWeightClass
            w.u16(5);    // usWidthClass
            w.u16(0);    // fsType: installable
            w.i16(scaled(0.65));  // subscript
            w.i16(scaled(0.60));
            w.i16(0);
            w.i16(scaled(0.075));
            w.i16(scaled(0.65));  // superscript
            w.i16(scaled(0.60));
            w.i16(0);
            w.i16(scaled(0.35));
            w.i16(scaled(0.05));  // strikeout
            w.i16(scaled(0.26));
            w.i16(0);  // sFamilyClass
            for (int i = 0; i < 10; ++i) {
                w.u8(0);  // panose
            }
            w.u32(1);  // Basic Latin
            w.u32(0);
            w.u32(0);
            w.u32(0);
            w.tag("NONE");
            w.u16(0x0040);  // REGULAR
            w.u16(t.char_map.empty() ? 0 : t.char_map.front().first);
            w.u16(t.char_map.empty() ? 0 : t.char_map.back().first);
            w.i16(info.ascent);
            w.i16(-info.descent);
            w.i16(0);
            w.u16(static_cast<uint16_t>(std::max(info.ascent, t.y_max)));
            w.u16(static_cast<uint16_t>(std::max(info.descent, -t.y_min)));
            w.u32(1);  // Latin 1 code page
            w.u32(0);
            w.i16(glyph_top(t.doc, U'x'));
            w.i16(glyph_top(t.doc, U'H'));
            w.u16(0);    // usDefaultChar
            w.u16(0x20); // usBreakChar
            w.u16(0);    // usMaxContext
            return w.take();
        }

        std::vector<uint8_t> hmtx_table(const font_tables& t) {
            byte_writer w;
            for (const auto& g : t.glyphs) {
                w.u16(static_cast<uint16_t>(g.advance));
                w.i16(g.lsb);
            }
            return w.take();
        }

        std::vector<uint8_t> cmap_table(const font_tables& t) {
            struct range {
                uint16_t start;
                uint16_t end;
                uint16_t delta;
            };
            std::vector<range> ranges;
            for (const auto& [cp, gid] : t.char_map) {
                if (cp == 0xFFFF) {
                    continue;
                }
                if (!ranges.empty()) {
                    range& r = ranges.back();
                    if (cp == r.end + 1 && static_cast<uint16_t>(gid - cp) == r.delta) {
                        r.end = cp;
                        continue;
                    }
                }
                ranges.push_back({cp, cp, static_cast<uint16_t>(gid - cp)});
            }
            ranges.push_back({0xFFFF, 0xFFFF, 1});

            const auto seg_count = static_cast<uint16_t>(ranges.size());
            uint16_t entry_selector = 0;
            while ((2u << entry_selector) <= seg_count) {
                ++entry_selector;
            }
            const auto search_range = static_cast<uint16_t>(2u << entry_selector);

            byte_writer w;
            w.u16(0);  // version
            w.u16(2);
            w.u16(0);  // Unicode
            w.u16(3);  // BMP
            w.u32(20);
            w.u16(3);  // Windows
            w.u16(1);  // Unicode BMP
            w.u32(20);

            w.u16(4);
            w.u16(static_cast<uint16_t>(16 + 8 * seg_count));
            w.u16(0);  // language
            w.u16(static_cast<uint16_t>(seg_count * 2));
            w.u16(search_range);
            w.u16(entry_selector);
            w.u16(static_cast<uint16_t>(seg_count * 2 - search_range));
            for (const auto& r : ranges) {
                w.u16(r.end);
            }
            w.u16(0);  // reservedPad
            for (const auto& r : ranges) {
                w.u16(r.start);
            }
            for (const auto& r : ranges) {
                w.u16(r.delta);
            }
            for (std::size_t i = 0; i < ranges.size(); ++i) {
                w.u16(0);  // idRangeOffset
            }
            return w.take();
        }

        std::pair<std::vector<uint8_t>, std::vector<uint8_t>> glyf_loca_tables(const font_tables& t) {
            byte_writer glyf;
            byte_writer loca;
            for (const auto& g : t.glyphs) {
                loca.u32(static_cast<uint32_t>(glyf.size()));
                glyf.bytes(encode_glyph(g));
            }
            loca.u32(static_cast<uint32_t>(glyf.size()));
            return {glyf.take(), loca.take()};
        }

        std::vector<uint8_t> name_table(const font_tables& t) {
            const font_info& info = t.doc.info();
            const std::string full_name = info.family + " " + info.style;

            std::vector<std::pair<uint16_t, std::vector<uint8_t>>> records;
            auto add = [&records](uint16_t id, const std::string& text) {
                if (!text.empty()) {
                    records.emplace_back(id, to_utf16be(text));
                }
            };
            add(0, info.copyright);
            add(1, info.family);
            add(2, info.style);
            add(3, "inkfont: " + full_name + ": " + info.version);
            add(4, full_name);
            add(5, "Version " + info.version);
            add(6, info.postscript_name());

            byte_writer w;
            w.u16(0);
            w.u16(static_cast<uint16_t>(records.size()));
            w.u16(static_cast<uint16_t>(6 + 12 * records.size()));
            std::size_t offset = 0;
            for (const auto& [id, text] : records) {
                w.u16(3);       // Windows
                w.u16(1);       // Unicode BMP
                w.u16(0x0409);  // en-US
                w.u16(id);
                w.u16(static_cast<uint16_t>(text.size()));
                w.u16(static_cast<uint16_t>(offset));
                offset += text.size();
            }
            THROW_IF(offset > 0xFFFF, assembly_error, "font names are too long");
            for (const auto& rec : records) {
                w.bytes(rec.second);
            }
            return w.take();
        }

        std::vector<uint8_t> post_table(const font_tables& t) {
            int fixed_advance = -1;
            bool fixed_pitch = true;
            for (const auto& g : t.glyphs) {
                if (g.advance == 0) {
                    continue;
                }
                if (fixed_advance < 0) {
                    fixed_advance = g.advance;
                } else if (g.advance != fixed_advance) {
                    fixed_pitch = false;
                }
            }
            const int upm = t.doc.info().units_per_em;

            byte_writer w;
            w.u32(0x00030000);
            w.u32(0);  // italicAngle
            w.i16(-upm / 10);
            w.i16(upm / 20);
            w.u32(fixed_pitch && fixed_advance > 0 ? 1 : 0);
            for (int i = 0; i < 4; ++i) {
                w.u32(0);
            }
            return w.take();
        }

        struct table {
            std::string tag;
            std::vector<uint8_t> data;
        };

        void approximate(point p0, point p1, point p2, point p3, double tolerance, int depth,
                         std::vector<segment>& out) {
            // Distance between a cubic and its midpoint quadratic is at most
            // sqrt(3)/36 * |p3 - 3p2 + 3p1 - p0|.
            const double dx = p3.x - 3.0 * p2.x + 3.0 * p1.x - p0.x;
            const double dy = p3.y - 3.0 * p2.y + 3.0 * p1.y - p0.y;
            const double error = std::sqrt(3.0) / 36.0 * std::hypot(dx, dy);
            if (error <= tolerance || depth >= 12) {
                const point q{(3.0 * (p1.x + p2.x) - p0.x - p3.x) / 4.0,
                              (3.0 * (p1.y + p2.y) - p0.y - p3.y) / 4.0};
                out.push_back(segment::quad_to(q, p3));
                return;
            }
            const auto mid = [](point a, point b) { return point{(a.x + b.x) / 2.0, (a.y + b.y) / 2.0}; };
            const point ab = mid(p0, p1);
            const point bc = mid(p1, p2);
            const point cd = mid(p2, p3);
            const point abc = mid(ab, bc);
            const point bcd = mid(bc, cd);
            const point m = mid(abc, bcd);
            approximate(p0, ab, abc, m, tolerance, depth + 1, out);
            approximate(m, bcd, cd, p3, tolerance, depth + 1, out);
        }
    }

    std::vector<segment> quadratic_approximation(point from, const segment& cubic, double tolerance) {
        if (cubic.kind != segment_kind::cubic) {
            return {cubic};
        }
        std::vector<segment> out;
        approximate(from, cubic.c1, cubic.c2, cubic.to, tolerance, 0, out);
        return out;
    }

    uint32_t table_checksum(const uint8_t* data, std::size_t size) noexcept {
        uint32_t sum = 0;
        for (std::size_t i = 0; i < size; i += 4) {
            uint32_t word = 0;
            for (std::size_t k = 0; k < 4; ++k) {
                word <<= 8;
                if (i + k < size) {
                    word |= data[i + k];
                }
            }
            sum += word;
        }
        return sum;
    }

    std::vector<uint8_t> truetype_compiler::encode(const font_document& doc) const {
        const font_tables t = collect(doc);
        auto [glyf, loca] = glyf_loca_tables(t);

        std::vector<table> tables;
        tables.push_back({"OS/2", os2_table(t)});
        tables.push_back({"cmap", cmap_table(t)});
        tables.push_back({"glyf", std::move(glyf)});
        tables.push_back({"head", head_table(t)});
        tables.push_back({"hhea", hhea_table(t)});
        tables.push_back({"hmtx", hmtx_table(t)});
        tables.push_back({"loca", std::move(loca)});
        tables.push_back({"maxp", maxp_table(t)});
        tables.push_back({"name", name_table(t)});
        tables.push_back({"post", post_table(t)});
        std::sort(tables.begin(), tables.end(), [](const table& a, const table& b) { return a.tag < b.tag; });

        const auto num_tables = static_cast<uint16_t>(tables.size());
        uint16_t entry_selector = 0;
        while ((2u << entry_selector) <= num_tables) {
            ++entry_selector;
        }
        const auto search_range = static_cast<uint16_t>(16u << entry_selector);

        byte_writer font;
        font.u32(0x00010000);
        font.u16(num_tables);
        font.u16(search_range);
        font.u16(entry_selector);
        font.u16(static_cast<uint16_t>(num_tables * 16 - search_range));

        std::size_t offset = 12 + 16 * tables.size();
        std::size_t head_offset = 0;
        for (const auto& tb : tables) {
            if (tb.tag == "head") {
                head_offset = offset;
            }
            font.tag(tb.tag);
            font.u32(table_checksum(tb.data.data(), tb.data.size()));
            font.u32(static_cast<uint32_t>(offset));
            font.u32(static_cast<uint32_t>(tb.data.size()));
            offset += (tb.data.size() + 3) & ~std::size_t{3};
        }
        for (const auto& tb : tables) {
            font.bytes(tb.data);
            font.pad4();
        }

        const uint32_t sum = table_checksum(font.data().data(), font.size());
        font.patch_u32(head_offset + 8, CHECKSUM_MAGIC - sum);

        LOG_DEBUG("truetype: ", t.glyphs.size(), " glyphs, ", font.size(), " bytes");
        return font.take();
    }

    void truetype_compiler::compile(const font_document& doc, const std::filesystem::path& output,
                                    const compile_job&) const {
        const auto bytes = encode(doc);
        std::ofstream out(output, std::ios::binary | std::ios::trunc);
        THROW_IF(!out, assembly_error, "cannot create ", output.string());
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        THROW_IF(!out, assembly_error, "cannot write ", output.string());
    }
}  // namespace inkfont
