/**
 * @file image.hh
 * @brief 8-bit grayscale image with owned storage.
 *
 * gray_image is the pixel currency between the template renderer, the region
 * extractor and file I/O. Values are luminance: 0 is black ink, 255 is white
 * paper. Writes outside the image are clipped, reads outside it are a
 * programming error.
 *
 * @section image_io File I/O
 *
 * Decoding goes through stb_image, so PNG, JPEG, BMP, TGA, GIF (first frame)
 * and PNM sources all work. Colour is reduced with the Rec. 601 weights and
 * alpha is composited over white paper:
 *
 * @code
 *   Y = 0.299 R + 0.587 G + 0.114 B
 *   L = Y * a / 255 + 255 * (255 - a) / 255
 * @endcode
 *
 * @code{.cpp}
 * gray_image scan = gray_image::load("filled_template.png");
 * uint8_t v = scan.pixel(10, 10);
 * scan.save_png("copy.png");
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace inkfont {
    class INKFONT_EXPORT gray_image {
    public:
        gray_image() = default;

        /**
         * @brief Construct an image filled with @p fill.
         * @throws std::invalid_argument on negative dimensions
         */
        gray_image(int width, int height, uint8_t fill = 255);

        /**
         * @brief Decode an image file.
         * @throws extraction_error if the file cannot be read or decoded
         */
        [[nodiscard]] static gray_image load(const std::filesystem::path& path);

        /**
         * @brief Decode an in-memory image file.
         * @throws extraction_error if the bytes cannot be decoded
         */
        [[nodiscard]] static gray_image decode(std::span<const uint8_t> bytes);

        /// @throws std::runtime_error if the file cannot be written
        void save_png(const std::filesystem::path& path) const;

        [[nodiscard]] int width() const noexcept { return m_width; }
        [[nodiscard]] int height() const noexcept { return m_height; }
        [[nodiscard]] bool empty() const noexcept { return m_pixels.empty(); }

        [[nodiscard]] uint8_t pixel(int x, int y) const;
        void put_pixel(int x, int y, uint8_t value) noexcept;

        /// Horizontal run of pixel values, clipped.
        void put_span(int x, int y, const uint8_t* values, int count) noexcept;

        /// Rectangle filled with @p value, clipped.
        void fill_rect(int x, int y, int w, int h, uint8_t value) noexcept;

        /**
         * @brief Draw @p value through a coverage mask.
         *
         * Each mask byte is a coverage (0..255); the pixel becomes
         * lerp(current, value, coverage) but never lighter than it was.
         * Used for antialiased labels.
         */
        void blend_mask(int x, int y, const uint8_t* mask, int mask_width, int mask_height,
                        uint8_t value) noexcept;

        [[nodiscard]] const uint8_t* data() const noexcept { return m_pixels.data(); }
        [[nodiscard]] std::span<const uint8_t> row(int y) const;

    private:
        std::vector<uint8_t> m_pixels;
        int m_width = 0;
        int m_height = 0;
    };

    /// Rec. 601 luminance of an RGBA pixel composited over white.
    [[nodiscard]] INKFONT_EXPORT uint8_t luminance(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) noexcept;
} // namespace inkfont
