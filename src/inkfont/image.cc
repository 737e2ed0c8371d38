//
// Created by igor on 19/10/2026.
//

#include <inkfont/image.hh>
#include <inkfont/errors.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/enforce.hh>
#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>

#include <stb_image.h>
#include <stb_image_write.h>

namespace inkfont {
    namespace {
        struct stbi_deleter {
            void operator()(stbi_uc* p) const noexcept { stbi_image_free(p); }
        };

        using stbi_pixels = std::unique_ptr<stbi_uc, stbi_deleter>;

        gray_image from_stbi(stbi_pixels pixels, int w, int h, int channels) {
            gray_image img(w, h);
            const stbi_uc* src = pixels.get();
            std::vector<uint8_t> line(static_cast<std::size_t>(w));
            for (int y = 0; y < h; ++y) {
                for (int x = 0; x < w; ++x) {
                    const stbi_uc* p = src + (static_cast<std::size_t>(y) * w + x) * channels;
                    switch (channels) {
                        case 1: line[x] = p[0]; break;
                        case 2: line[x] = luminance(p[0], p[0], p[0], p[1]); break;
                        case 3: line[x] = luminance(p[0], p[1], p[2]); break;
                        default: line[x] = luminance(p[0], p[1], p[2], p[3]); break;
                    }
                }
                img.put_span(0, y, line.data(), w);
            }
            return img;
        }
    }

    uint8_t luminance(uint8_t r, uint8_t g, uint8_t b, uint8_t a) noexcept {
        const double y = 0.299 * r + 0.587 * g + 0.114 * b;
        const double composited = (y * a + 255.0 * (255 - a)) / 255.0;
        return static_cast<uint8_t>(std::clamp(composited + 0.5, 0.0, 255.0));
    }

    gray_image::gray_image(int width, int height, uint8_t fill) {
        THROW_IF(width < 0 || height < 0, std::invalid_argument,
                 "image dimensions must not be negative, got ", width, "x", height);
        m_pixels.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), fill);
        m_width = width;
        m_height = height;
    }

    gray_image gray_image::load(const std::filesystem::path& path) {
        int w = 0, h = 0, channels = 0;
        stbi_pixels pixels(stbi_load(path.string().c_str(), &w, &h, &channels, 0));
        THROW_IF(!pixels, extraction_error,
                 "cannot decode image ", path.string(), ": ", stbi_failure_reason());
        return from_stbi(std::move(pixels), w, h, channels);
    }

    gray_image gray_image::decode(std::span<const uint8_t> bytes) {
        THROW_IF(bytes.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()), extraction_error,
                 "image buffer too large");
        int w = 0, h = 0, channels = 0;
        stbi_pixels pixels(stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                 &w, &h, &channels, 0));
        THROW_IF(!pixels, extraction_error, "cannot decode image: ", stbi_failure_reason());
        return from_stbi(std::move(pixels), w, h, channels);
    }

    void gray_image::save_png(const std::filesystem::path& path) const {
        THROW_IF(empty(), std::runtime_error, "cannot write an empty image to ", path.string());
        const int ok = stbi_write_png(path.string().c_str(), m_width, m_height, 1, m_pixels.data(), m_width);
        THROW_IF(ok == 0, std::runtime_error, "cannot write PNG ", path.string());
    }

    uint8_t gray_image::pixel(int x, int y) const {
        ENFORCE(x >= 0 && x < m_width && y >= 0 && y < m_height);
        return m_pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) +
                        static_cast<std::size_t>(x)];
    }

    void gray_image::put_pixel(int x, int y, uint8_t value) noexcept {
        if (x >= 0 && x < m_width && y >= 0 && y < m_height) {
            m_pixels[static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) +
                     static_cast<std::size_t>(x)] = value;
        }
    }

    void gray_image::put_span(int x, int y, const uint8_t* values, int count) noexcept {
        if (y < 0 || y >= m_height) return;
        const int x0 = std::max(0, x);
        const int x1 = std::min(m_width, x + count);
        if (x0 < x1) {
            const std::size_t offset = static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) +
                                       static_cast<std::size_t>(x0);
            std::memcpy(m_pixels.data() + offset, values + (x0 - x), static_cast<std::size_t>(x1 - x0));
        }
    }

    void gray_image::fill_rect(int x, int y, int w, int h, uint8_t value) noexcept {
        const int x0 = std::max(0, x);
        const int y0 = std::max(0, y);
        const int x1 = std::min(m_width, x + w);
        const int y1 = std::min(m_height, y + h);
        for (int yy = y0; yy < y1; ++yy) {
            auto* row_start = m_pixels.data() + static_cast<std::size_t>(yy) * static_cast<std::size_t>(m_width);
            std::fill(row_start + x0, row_start + std::max(x0, x1), value);
        }
    }

    void gray_image::blend_mask(int x, int y, const uint8_t* mask, int mask_width, int mask_height,
                                uint8_t value) noexcept {
        for (int my = 0; my < mask_height; ++my) {
            const int ty = y + my;
            if (ty < 0 || ty >= m_height) continue;
            for (int mx = 0; mx < mask_width; ++mx) {
                const int tx = x + mx;
                if (tx < 0 || tx >= m_width) continue;
                const int coverage = mask[static_cast<std::size_t>(my) * mask_width + mx];
                if (coverage == 0) continue;
                auto& dst = m_pixels[static_cast<std::size_t>(ty) * static_cast<std::size_t>(m_width) +
                                     static_cast<std::size_t>(tx)];
                const auto blended = static_cast<uint8_t>((dst * (255 - coverage) + value * coverage + 127) / 255);
                dst = std::min(dst, blended);
            }
        }
    }

    std::span<const uint8_t> gray_image::row(int y) const {
        ENFORCE(y >= 0 && y < m_height);
        return {m_pixels.data() + static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width),
                static_cast<std::size_t>(m_width)};
    }
}  // namespace inkfont
