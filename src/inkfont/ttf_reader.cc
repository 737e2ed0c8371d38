//
// Created by igor on 19/10/2026.
//

#include <inkfont/ttf_reader.hh>
#include <failsafe/failsafe.hh>
#include <fstream>
#include <iterator>

// Disable warnings for stb_truetype (third-party header)
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#pragma GCC diagnostic ignored "-Wdouble-promotion"
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#ifdef __clang__
#pragma clang diagnostic ignored "-Wdeprecated-anon-enum-enum-conversion"
#endif
#endif

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

namespace inkfont {
    struct ttf_reader::impl {
        std::vector<uint8_t> data;
        stbtt_fontinfo font_info{};
        bool valid = false;

        impl(std::vector<uint8_t> bytes, int font_index)
            : data(std::move(bytes)) {
            if (data.empty()) {
                return;
            }

            const int offset = stbtt_GetFontOffsetForIndex(data.data(), font_index);
            if (offset < 0) {
                return;
            }

            valid = stbtt_InitFont(&font_info, data.data(), offset) != 0;
        }

        [[nodiscard]] int glyph_index(char32_t codepoint) const {
            return stbtt_FindGlyphIndex(&font_info, static_cast<int>(codepoint));
        }

        [[nodiscard]] uint16_t read_u16(std::size_t offset) const {
            if (offset + 2 > data.size()) {
                return 0;
            }
            return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
        }
    };

    ttf_reader::ttf_reader(std::vector<uint8_t> bytes, int font_index)
        : m_impl(std::make_unique<impl>(std::move(bytes), font_index)) {
    }

    ttf_reader ttf_reader::load(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IF(!file, std::runtime_error, "Cannot open file:", path.string());
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        THROW_IF(file.bad(), std::runtime_error, "Cannot read file:", path.string());
        return ttf_reader(std::move(bytes));
    }

    ttf_reader::~ttf_reader() = default;

    ttf_reader::ttf_reader(ttf_reader&& other) noexcept = default;

    ttf_reader& ttf_reader::operator=(ttf_reader&& other) noexcept = default;

    bool ttf_reader::is_valid() const {
        return m_impl && m_impl->valid;
    }

    int ttf_reader::units_per_em() const {
        if (!is_valid()) {
            return 0;
        }
        // head.unitsPerEm
        return m_impl->read_u16(static_cast<std::size_t>(m_impl->font_info.head) + 18);
    }

    ttf_vmetrics ttf_reader::vmetrics() const {
        ttf_vmetrics m;
        if (is_valid()) {
            stbtt_GetFontVMetrics(&m_impl->font_info, &m.ascent, &m.descent, &m.line_gap);
        }
        return m;
    }

    int ttf_reader::glyph_count() const {
        return is_valid() ? m_impl->font_info.numGlyphs : 0;
    }

    std::string ttf_reader::family_name() const {
        if (!is_valid()) {
            return {};
        }
        int length = 0;
        const char* raw = stbtt_GetFontNameString(&m_impl->font_info, &length,
                                                  STBTT_PLATFORM_ID_MICROSOFT, STBTT_MS_EID_UNICODE_BMP,
                                                  STBTT_MS_LANG_ENGLISH, 1);
        if (!raw) {
            return {};
        }
        // UTF-16BE; names written by the assembler are ASCII.
        std::string out;
        for (int i = 0; i + 1 < length; i += 2) {
            const auto hi = static_cast<unsigned char>(raw[i]);
            const auto lo = static_cast<unsigned char>(raw[i + 1]);
            out.push_back(hi == 0 && lo < 0x80 ? static_cast<char>(lo) : '?');
        }
        return out;
    }

    bool ttf_reader::has_glyph(char32_t codepoint) const {
        return is_valid() && m_impl->glyph_index(codepoint) != 0;
    }

    std::optional<ttf_glyph_box> ttf_reader::glyph_box(char32_t codepoint) const {
        if (!has_glyph(codepoint)) {
            return std::nullopt;
        }
        ttf_glyph_box box;
        if (!stbtt_GetGlyphBox(&m_impl->font_info, m_impl->glyph_index(codepoint),
                               &box.x_min, &box.y_min, &box.x_max, &box.y_max)) {
            return std::nullopt;
        }
        return box;
    }

    std::optional<ttf_hmetrics> ttf_reader::hmetrics(char32_t codepoint) const {
        if (!has_glyph(codepoint)) {
            return std::nullopt;
        }
        ttf_hmetrics m;
        stbtt_GetGlyphHMetrics(&m_impl->font_info, m_impl->glyph_index(codepoint),
                               &m.advance_width, &m.left_bearing);
        return m;
    }

    int ttf_reader::contour_count(char32_t codepoint) const {
        if (!has_glyph(codepoint)) {
            return 0;
        }
        stbtt_vertex* vertices = nullptr;
        const int n = stbtt_GetGlyphShape(&m_impl->font_info, m_impl->glyph_index(codepoint), &vertices);
        int contours = 0;
        for (int i = 0; i < n; ++i) {
            if (vertices[i].type == STBTT_vmove) {
                ++contours;
            }
        }
        stbtt_FreeShape(&m_impl->font_info, vertices);
        return contours;
    }

    std::optional<label_bitmap> ttf_reader::rasterize(char32_t codepoint, float pixel_height) const {
        if (!has_glyph(codepoint)) {
            return std::nullopt;
        }

        const int glyph = m_impl->glyph_index(codepoint);
        const float scale = stbtt_ScaleForPixelHeight(&m_impl->font_info, pixel_height);

        int width = 0, height = 0, x_off = 0, y_off = 0;
        unsigned char* bitmap = stbtt_GetGlyphBitmap(&m_impl->font_info, scale, scale, glyph,
                                                     &width, &height, &x_off, &y_off);

        label_bitmap result;
        result.width = width;
        result.height = height;
        result.offset_x = x_off;
        result.offset_y = y_off;

        if (bitmap && width > 0 && height > 0) {
            const std::size_t size = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
            result.coverage.assign(bitmap, bitmap + size);
        } else {
            result.width = 0;
            result.height = 0;
        }
        if (bitmap) {
            stbtt_FreeBitmap(bitmap, nullptr);
        }

        int advance_width = 0, left_bearing = 0;
        stbtt_GetGlyphHMetrics(&m_impl->font_info, glyph, &advance_width, &left_bearing);
        result.advance = static_cast<float>(advance_width) * scale;
        return result;
    }

    std::span<const uint8_t> ttf_reader::bytes() const {
        if (!m_impl) {
            return {};
        }
        return {m_impl->data.data(), m_impl->data.size()};
    }
}  // namespace inkfont
