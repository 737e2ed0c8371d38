//
// Created by igor on 19/10/2026.
//

#include <inkfont/tracing/potrace_svg.hh>
#include <inkfont/errors.hh>
#include <failsafe/failsafe.hh>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>

namespace inkfont {
    namespace {
        class number_reader {
        public:
            explicit number_reader(std::string_view text)
                : m_text(text) {
            }

            void skip_separators() noexcept {
                while (m_pos < m_text.size() &&
                       (std::isspace(static_cast<unsigned char>(m_text[m_pos])) || m_text[m_pos] == ',')) {
                    ++m_pos;
                }
            }

            [[nodiscard]] bool at_end() noexcept {
                skip_separators();
                return m_pos >= m_text.size();
            }

            [[nodiscard]] char peek() noexcept {
                skip_separators();
                return m_pos < m_text.size() ? m_text[m_pos] : '\0';
            }

            char take() noexcept {
                skip_separators();
                return m_pos < m_text.size() ? m_text[m_pos++] : '\0';
            }

            [[nodiscard]] bool number_next() noexcept {
                const char c = peek();
                return c == '-' || c == '+' || c == '.' || std::isdigit(static_cast<unsigned char>(c));
            }

            double number() {
                skip_separators();
                // from_chars rejects a leading '+'
                if (m_pos < m_text.size() && m_text[m_pos] == '+') {
                    ++m_pos;
                }
                double value = 0.0;
                const char* begin = m_text.data() + m_pos;
                const char* end = m_text.data() + m_text.size();
                const auto [ptr, ec] = std::from_chars(begin, end, value);
                THROW_IF(ec != std::errc{} || ptr == begin, tracing_failure,
                         "expected a number at offset ", m_pos, " of '", std::string(m_text.substr(0, 64)), "'");
                m_pos += static_cast<std::size_t>(ptr - begin);
                return value;
            }

            [[nodiscard]] std::size_t position() const noexcept { return m_pos; }

        private:
            std::string_view m_text;
            std::size_t m_pos = 0;
        };

        // Value of attribute @p name inside the tag starting at @p tag_pos.
        std::optional<std::string_view> attribute(std::string_view doc, std::size_t tag_pos, std::string_view name) {
            const std::size_t tag_end = doc.find('>', tag_pos);
            const std::string_view tag = doc.substr(tag_pos, tag_end == std::string_view::npos
                                                                 ? std::string_view::npos
                                                                 : tag_end - tag_pos);
            std::size_t pos = 0;
            while ((pos = tag.find(name, pos)) != std::string_view::npos) {
                const bool boundary = pos > 0 && std::isspace(static_cast<unsigned char>(tag[pos - 1]));
                std::size_t p = pos + name.size();
                while (p < tag.size() && std::isspace(static_cast<unsigned char>(tag[p]))) ++p;
                if (boundary && p < tag.size() && tag[p] == '=') {
                    ++p;
                    while (p < tag.size() && std::isspace(static_cast<unsigned char>(tag[p]))) ++p;
                    if (p < tag.size() && (tag[p] == '"' || tag[p] == '\'')) {
                        const char quote = tag[p];
                        const std::size_t close = tag.find(quote, p + 1);
                        if (close != std::string_view::npos) {
                            return tag.substr(p + 1, close - p - 1);
                        }
                    }
                }
                pos += name.size();
            }
            return std::nullopt;
        }

        std::size_t find_tag(std::string_view doc, std::string_view tag, std::size_t from) {
            std::size_t pos = from;
            while ((pos = doc.find(tag, pos)) != std::string_view::npos) {
                const std::size_t after = pos + tag.size();
                if (after < doc.size() &&
                    (std::isspace(static_cast<unsigned char>(doc[after])) || doc[after] == '/' || doc[after] == '>')) {
                    return pos;
                }
                pos = after;
            }
            return std::string_view::npos;
        }

        class path_builder {
        public:
            void move_to(point p) {
                flush();
                m_current = contour{};
                m_current->start = p;
                m_pen = p;
            }

            void add(const segment& s) {
                THROW_IF(!m_current, tracing_failure, "path segment before the first moveto");
                m_current->segments.push_back(s);
                m_pen = s.to;
            }

            void close() {
                if (m_current) {
                    m_pen = m_current->start;
                    flush();
                }
            }

            [[nodiscard]] point pen() const noexcept { return m_pen; }

            std::vector<contour> finish() {
                flush();
                return std::move(m_contours);
            }

        private:
            void flush() {
                if (m_current) {
                    m_contours.push_back(std::move(*m_current));
                    m_current.reset();
                }
            }

            std::vector<contour> m_contours;
            std::optional<contour> m_current;
            point m_pen;
        };
    }

    affine parse_svg_transform(std::string_view text) {
        affine m;
        std::size_t pos = 0;
        while (pos < text.size()) {
            while (pos < text.size() && (std::isspace(static_cast<unsigned char>(text[pos])) || text[pos] == ',')) {
                ++pos;
            }
            if (pos >= text.size()) {
                break;
            }
            const std::size_t open = text.find('(', pos);
            const std::size_t close = text.find(')', pos);
            THROW_IF(open == std::string_view::npos || close == std::string_view::npos || close < open,
                     tracing_failure, "malformed transform '", std::string(text), "'");

            std::string_view fn = text.substr(pos, open - pos);
            while (!fn.empty() && std::isspace(static_cast<unsigned char>(fn.back()))) fn.remove_suffix(1);

            number_reader args(text.substr(open + 1, close - open - 1));
            std::vector<double> v;
            while (!args.at_end()) {
                v.push_back(args.number());
            }

            affine op;
            if (fn == "translate" && (v.size() == 1 || v.size() == 2)) {
                op = affine::translate(v[0], v.size() == 2 ? v[1] : 0.0);
            } else if (fn == "scale" && (v.size() == 1 || v.size() == 2)) {
                op = affine{v[0], 0.0, 0.0, v.size() == 2 ? v[1] : v[0], 0.0, 0.0};
            } else if (fn == "matrix" && v.size() == 6) {
                op = affine{v[0], v[1], v[2], v[3], v[4], v[5]};
            } else {
                THROW(tracing_failure, "unsupported transform '", std::string(fn), "' with ", v.size(), " arguments");
            }
            // The rightmost function applies first.
            m = op.then(m);
            pos = close + 1;
        }
        return m;
    }

    std::vector<contour> parse_svg_path(std::string_view data) {
        number_reader in(data);
        path_builder path;
        char command = '\0';

        auto pt = [&in](bool relative, point pen) {
            const double x = in.number();
            const double y = in.number();
            return relative ? point{pen.x + x, pen.y + y} : point{x, y};
        };

        while (!in.at_end()) {
            if (!in.number_next()) {
                command = in.take();
            } else {
                THROW_IF(command == '\0' || command == 'Z' || command == 'z', tracing_failure,
                         "path data has numbers without a command at offset ", in.position());
            }

            const bool rel = std::islower(static_cast<unsigned char>(command)) != 0;
            const point pen = path.pen();
            switch (command) {
                case 'M':
                case 'm':
                    path.move_to(pt(rel, pen));
                    // Further coordinate pairs are implicit linetos.
                    command = rel ? 'l' : 'L';
                    break;
                case 'L':
                case 'l':
                    path.add(segment::line_to(pt(rel, pen)));
                    break;
                case 'H':
                case 'h': {
                    const double x = in.number();
                    path.add(segment::line_to({rel ? pen.x + x : x, pen.y}));
                    break;
                }
                case 'V':
                case 'v': {
                    const double y = in.number();
                    path.add(segment::line_to({pen.x, rel ? pen.y + y : y}));
                    break;
                }
                case 'C':
                case 'c': {
                    const point a = pt(rel, pen);
                    const point b = pt(rel, pen);
                    const point to = pt(rel, pen);
                    path.add(segment::cubic_to(a, b, to));
                    break;
                }
                case 'Q':
                case 'q': {
                    const point c = pt(rel, pen);
                    const point to = pt(rel, pen);
                    path.add(segment::quad_to(c, to));
                    break;
                }
                case 'Z':
                case 'z':
                    path.close();
                    break;
                default:
                    THROW(tracing_failure, "unsupported path command '", std::string(1, command), "'");
            }
        }
        return path.finish();
    }

    raw_path parse_potrace_svg(std::string_view svg, int width, int height) {
        const std::size_t svg_pos = find_tag(svg, "<svg", 0);
        THROW_IF(svg_pos == std::string_view::npos, tracing_failure, "tracer output is not an SVG document");

        // viewBox units to bitmap pixels
        affine to_pixels;
        if (const auto vb = attribute(svg, svg_pos, "viewBox")) {
            number_reader r(*vb);
            const double vx = r.number();
            const double vy = r.number();
            const double vw = r.number();
            const double vh = r.number();
            THROW_IF(vw <= 0.0 || vh <= 0.0, tracing_failure, "SVG viewBox has no area");
            to_pixels = affine::translate(-vx, -vy).then(affine{width / vw, 0.0, 0.0, height / vh, 0.0, 0.0});
        }

        affine group;
        const std::size_t g_pos = find_tag(svg, "<g", svg_pos);
        if (g_pos != std::string_view::npos) {
            if (const auto t = attribute(svg, g_pos, "transform")) {
                group = parse_svg_transform(*t);
            }
        }
        const affine full = group.then(to_pixels);

        raw_path out;
        out.width = width;
        out.height = height;

        std::size_t pos = svg_pos;
        while ((pos = find_tag(svg, "<path", pos)) != std::string_view::npos) {
            const auto d = attribute(svg, pos, "d");
            THROW_IF(!d, tracing_failure, "SVG path without path data");
            for (auto& c : parse_svg_path(*d)) {
                out.contours.push_back(transformed(c, full));
            }
            pos += 5;
        }
        return out;
    }
}  // namespace inkfont
