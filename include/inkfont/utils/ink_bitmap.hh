/**
 * @file ink_bitmap.hh
 * @brief Packed 1-bit bitmap of a binarized template cell.
 *
 * A set bit is ink, a clear bit is paper. Rows are packed MSB first and
 * padded to a whole byte, which is exactly the raster layout of a binary
 * PBM (P4) file, so the potrace engine can write the buffer out unchanged.
 *
 * @section ink_bitmap_layout Memory Layout
 *
 * @code
 *   width = 10, stride = 2
 *
 *   byte 0                          byte 1
 *   +---+---+---+---+---+---+---+---+---+---+---+---+---+---+---+---+
 *   | 0 | 1 | 2 | 3 | 4 | 5 | 6 | 7 | 8 | 9 | pad                   |  row 0
 *   +---+---+---+---+---+---+---+---+---+---+---+---+---+---+---+---+
 *   bit 7                       bit 0
 * @endcode
 *
 * @section ink_bitmap_usage Usage
 *
 * @code{.cpp}
 * ink_bitmap bits(cell_width, cell_height);
 * for (int y = 0; y < cell_height; ++y)
 *     for (int x = 0; x < cell_width; ++x)
 *         if (img.pixel(x, y) < threshold) bits.set_pixel(x, y);
 *
 * std::vector<uint8_t> pbm = bits.to_pbm();
 * @endcode
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/image.hh>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace inkfont {
    /// Bytes per row of a packed 1-bit bitmap.
    [[nodiscard]] constexpr int packed_stride(int width) noexcept {
        return (width + 7) / 8;
    }

    class INKFONT_EXPORT ink_bitmap {
    public:
        ink_bitmap() = default;

        /// All-paper bitmap.
        ink_bitmap(int width, int height);

        [[nodiscard]] int width() const noexcept { return m_width; }
        [[nodiscard]] int height() const noexcept { return m_height; }
        [[nodiscard]] int stride_bytes() const noexcept { return m_stride; }

        /// Checked read; coordinates must be inside the bitmap.
        [[nodiscard]] bool pixel(int x, int y) const;

        /// Unchecked-friendly read: anything outside the bitmap is paper.
        [[nodiscard]] bool ink_at(int x, int y) const noexcept;

        void set_pixel(int x, int y, bool on = true);
        void clear_pixel(int x, int y) { set_pixel(x, y, false); }

        [[nodiscard]] std::span<const std::byte> row(int y) const;

        /// Number of ink pixels.
        [[nodiscard]] std::size_t ink_count() const noexcept;

        /// Binary PBM (P4) file image.
        [[nodiscard]] std::vector<uint8_t> to_pbm() const;

        /// Black ink on white paper.
        [[nodiscard]] gray_image to_image() const;

    private:
        std::vector<std::byte> m_bits;
        int m_width = 0;
        int m_height = 0;
        int m_stride = 0;
    };
} // namespace inkfont
