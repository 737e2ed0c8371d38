//
// Created by igor on 19/10/2026.
//

#include <inkfont/template_renderer.hh>
#include <inkfont/ttf_reader.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace inkfont {
    namespace {
        constexpr int DASH_ON = 6;
        constexpr int DASH_OFF = 4;
        constexpr double LABEL_PADDING = 4.0;

        std::string fmt(double v) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.4g", v);
            return buf;
        }

        std::string gray(int level) {
            return "rgb(" + std::to_string(level) + "," + std::to_string(level) + "," + std::to_string(level) + ")";
        }

        std::string xml_escape(const std::string& s) {
            std::string out;
            out.reserve(s.size());
            for (char c : s) {
                switch (c) {
                    case '&': out += "&amp;"; break;
                    case '<': out += "&lt;"; break;
                    case '>': out += "&gt;"; break;
                    case '"': out += "&quot;"; break;
                    case '\'': out += "&apos;"; break;
                    default: out += c; break;
                }
            }
            return out;
        }

        int border_pixels(int thickness, double scale) {
            if (thickness <= 0) {
                return 0;
            }
            return std::max(1, scale_coord(thickness, scale));
        }
    }

    template_renderer::template_renderer(const grid_layout& grid, const template_settings& settings)
        : m_grid(grid), m_settings(settings) {
    }

    int template_renderer::raster_width() const noexcept {
        return scale_coord(m_grid.width(), m_settings.raster_scale);
    }

    int template_renderer::raster_height() const noexcept {
        return scale_coord(m_grid.height(), m_settings.raster_scale);
    }

    std::string template_renderer::svg(const character_set& set) const {
        validate(m_grid, set);

        const int width = m_grid.width();
        const int height = m_grid.height();
        const double t = m_grid.border_thickness;

        std::ostringstream out;
        out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width << "\" height=\"" << height
            << "\" viewBox=\"0 0 " << width << " " << height << "\">\n"
            << "  <rect width=\"" << width << "\" height=\"" << height << "\" fill=\"white\"/>\n";

        for (const auto& spec : set) {
            const cell_rect r = cell_for(m_grid, spec);

            // Stroke centered on the inner edge so it stays inside the cell.
            if (t > 0) {
                out << "  <rect x=\"" << fmt(r.x + t / 2) << "\" y=\"" << fmt(r.y + t / 2)
                    << "\" width=\"" << fmt(r.width - t) << "\" height=\"" << fmt(r.height - t)
                    << "\" fill=\"none\" stroke=\"black\" stroke-width=\"" << fmt(t) << "\"/>\n";
            }

            const double base_y = r.y + m_grid.baseline_offset();
            out << "  <line x1=\"" << fmt(r.x + t) << "\" y1=\"" << fmt(base_y)
                << "\" x2=\"" << fmt(r.x + r.width - t) << "\" y2=\"" << fmt(base_y)
                << "\" stroke=\"" << gray(m_settings.guide_gray)
                << "\" stroke-width=\"1\" stroke-dasharray=\"" << DASH_ON << " " << DASH_OFF << "\"/>\n";

            out << "  <text x=\"" << fmt(r.x + t + LABEL_PADDING)
                << "\" y=\"" << fmt(r.y + t + LABEL_PADDING + m_settings.label_size)
                << "\" font-family=\"sans-serif\" font-size=\"" << fmt(m_settings.label_size)
                << "\" fill=\"" << gray(m_settings.label_gray) << "\">"
                << xml_escape(spec.label) << "</text>\n";
        }

        out << "</svg>\n";
        return out.str();
    }

    gray_image template_renderer::raster(const character_set& set, const ttf_reader* label_font) const {
        validate(m_grid, set);

        gray_image img(raster_width(), raster_height(), 255);
        for (const auto& spec : set) {
            draw_cell(img, spec, label_font);
        }
        return img;
    }

    void template_renderer::draw_cell(gray_image& img, const character_spec& spec,
                                      const ttf_reader* label_font) const {
        const double s = m_settings.raster_scale;
        const cell_rect r = scale_rect(cell_for(m_grid, spec), s);
        const int t = border_pixels(m_grid.border_thickness, s);

        if (t > 0) {
            img.fill_rect(r.x, r.y, r.width, t, 0);
            img.fill_rect(r.x, r.y + r.height - t, r.width, t, 0);
            img.fill_rect(r.x, r.y, t, r.height, 0);
            img.fill_rect(r.x + r.width - t, r.y, t, r.height, 0);
        }

        const auto guide = static_cast<uint8_t>(m_settings.guide_gray);
        const int guide_y = scale_coord(cell_for(m_grid, spec).y + m_grid.baseline_offset(), s);
        const int dash_on = std::max(1, scale_coord(DASH_ON, s));
        const int period = dash_on + std::max(1, scale_coord(DASH_OFF, s));
        for (int x = r.x + t; x < r.x + r.width - t; ++x) {
            if ((x - r.x - t) % period < dash_on) {
                img.put_pixel(x, guide_y, guide);
            }
        }

        if (!label_font) {
            return;
        }
        const float pixel_height = static_cast<float>(m_settings.label_size * s);
        const int pad = scale_coord(LABEL_PADDING, s);
        int pen_x = r.x + t + pad;
        const int baseline = r.y + t + pad + static_cast<int>(pixel_height);

        // Labels are ASCII, one glyph per byte.
        for (char ch : spec.label) {
            const auto glyph = label_font->rasterize(static_cast<unsigned char>(ch), pixel_height);
            if (!glyph) {
                continue;
            }
            // Coverage blends from paper toward label_gray, never darker.
            img.blend_mask(pen_x + glyph->offset_x, baseline + glyph->offset_y,
                           glyph->coverage.data(), glyph->width, glyph->height,
                           static_cast<uint8_t>(m_settings.label_gray));
            pen_x += static_cast<int>(glyph->advance + 0.5f);
        }
    }

    void template_renderer::write_svg(const std::filesystem::path& path, const character_set& set) const {
        const std::string doc = svg(set);
        std::ofstream out(path, std::ios::binary);
        THROW_IF(!out, std::runtime_error, "cannot create ", path.string());
        out << doc;
        out.close();
        THROW_IF(!out, std::runtime_error, "cannot write ", path.string());
    }

    void template_renderer::write_png(const std::filesystem::path& path, const character_set& set,
                                      const ttf_reader* label_font) const {
        raster(set, label_font).save_png(path);
    }
}  // namespace inkfont
