//
// Created by igor on 19/10/2026.
//

#include <inkfont/utils/ink_bitmap.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/enforce.hh>
#include <bit>
#include <string>

namespace inkfont {
    ink_bitmap::ink_bitmap(int width, int height) {
        THROW_IF(width < 0 || height < 0, std::invalid_argument,
                 "bitmap dimensions must not be negative, got ", width, "x", height);
        m_width = width;
        m_height = height;
        m_stride = packed_stride(width);
        m_bits.assign(static_cast<std::size_t>(m_stride) * static_cast<std::size_t>(height), std::byte{0});
    }

    bool ink_bitmap::pixel(int x, int y) const {
        ENFORCE(x >= 0 && x < m_width && y >= 0 && y < m_height);
        const auto b = std::to_integer<std::uint8_t>(m_bits[static_cast<std::size_t>(y) * m_stride + (x >> 3)]);
        return ((b >> (7u - (x & 7u))) & 1u) != 0u;
    }

    bool ink_bitmap::ink_at(int x, int y) const noexcept {
        if (x < 0 || y < 0 || x >= m_width || y >= m_height) {
            return false;
        }
        const auto b = std::to_integer<std::uint8_t>(m_bits[static_cast<std::size_t>(y) * m_stride + (x >> 3)]);
        return ((b >> (7u - (x & 7u))) & 1u) != 0u;
    }

    void ink_bitmap::set_pixel(int x, int y, bool on) {
        ENFORCE(x >= 0 && x < m_width && y >= 0 && y < m_height);
        const std::size_t idx = static_cast<std::size_t>(y) * m_stride + (x >> 3);
        const auto mask = static_cast<std::uint8_t>(1u << (7u - (x & 7u)));

        auto b = std::to_integer<std::uint8_t>(m_bits[idx]);
        b = on ? (b | mask) : (b & ~mask);
        m_bits[idx] = std::byte{b};
    }

    std::span<const std::byte> ink_bitmap::row(int y) const {
        ENFORCE(y >= 0 && y < m_height);
        return {m_bits.data() + static_cast<std::size_t>(y) * m_stride, static_cast<std::size_t>(m_stride)};
    }

    std::size_t ink_bitmap::ink_count() const noexcept {
        // Padding bits are never set, so whole bytes can be counted.
        std::size_t count = 0;
        for (auto b : m_bits) {
            count += static_cast<std::size_t>(std::popcount(std::to_integer<std::uint8_t>(b)));
        }
        return count;
    }

    std::vector<uint8_t> ink_bitmap::to_pbm() const {
        const std::string header = "P4\n" + std::to_string(m_width) + " " + std::to_string(m_height) + "\n";
        std::vector<uint8_t> out;
        out.reserve(header.size() + m_bits.size());
        out.insert(out.end(), header.begin(), header.end());
        for (auto b : m_bits) {
            out.push_back(std::to_integer<uint8_t>(b));
        }
        return out;
    }

    gray_image ink_bitmap::to_image() const {
        gray_image img(m_width, m_height, 255);
        for (int y = 0; y < m_height; ++y) {
            for (int x = 0; x < m_width; ++x) {
                if (pixel(x, y)) {
                    img.put_pixel(x, y, 0);
                }
            }
        }
        return img;
    }
}  // namespace inkfont
