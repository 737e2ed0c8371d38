//
// Created by igor on 19/10/2026.
//

#include <inkfont/utils/utf8.hh>

namespace inkfont {
    namespace {
        constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

        constexpr bool is_continuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }

        void put_unit(std::vector<uint8_t>& out, uint16_t unit) {
            out.push_back(static_cast<uint8_t>(unit >> 8));
            out.push_back(static_cast<uint8_t>(unit & 0xFF));
        }
    }

    utf8_decode_result utf8_decode_one(std::string_view str) {
        if (str.empty()) {
            return {REPLACEMENT_CHAR, 0};
        }

        const auto* data = reinterpret_cast<const unsigned char*>(str.data());
        const std::size_t len = str.size();
        const unsigned char first = data[0];

        if (first < 0x80) {
            return {static_cast<char32_t>(first), 1};
        }
        if (is_continuation(first) || first >= 0xF8) {
            return {REPLACEMENT_CHAR, 1};
        }

        int need;
        char32_t cp;
        char32_t min_value;
        if ((first & 0xE0) == 0xC0) {
            need = 2;
            cp = first & 0x1F;
            min_value = 0x80;
        } else if ((first & 0xF0) == 0xE0) {
            need = 3;
            cp = first & 0x0F;
            min_value = 0x800;
        } else {
            need = 4;
            cp = first & 0x07;
            min_value = 0x10000;
        }

        if (len < static_cast<std::size_t>(need)) {
            return {REPLACEMENT_CHAR, 1};
        }
        for (int i = 1; i < need; ++i) {
            if (!is_continuation(data[i])) {
                return {REPLACEMENT_CHAR, 1};
            }
            cp = (cp << 6) | (data[i] & 0x3F);
        }

        // Overlong, surrogate or out of range
        if (cp < min_value || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return {REPLACEMENT_CHAR, need};
        }
        return {cp, need};
    }

    std::vector<uint8_t> to_utf16be(std::string_view str) {
        std::vector<uint8_t> out;
        out.reserve(str.size() * 2);
        while (!str.empty()) {
            const auto [cp, bytes] = utf8_decode_one(str);
            if (bytes == 0) {
                break;
            }
            str.remove_prefix(static_cast<std::size_t>(bytes));

            if (cp < 0x10000) {
                put_unit(out, static_cast<uint16_t>(cp));
            } else {
                const char32_t v = cp - 0x10000;
                put_unit(out, static_cast<uint16_t>(0xD800 + (v >> 10)));
                put_unit(out, static_cast<uint16_t>(0xDC00 + (v & 0x3FF)));
            }
        }
        return out;
    }
}  // namespace inkfont
