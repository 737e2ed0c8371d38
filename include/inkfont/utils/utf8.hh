/**
 * @file utf8.hh
 * @brief UTF-8 decoding and UTF-16BE encoding for font name strings.
 *
 * Font names come from the configuration as UTF-8; the TrueType @c name
 * table stores Windows records as UTF-16 big endian. Invalid UTF-8 decodes
 * to U+FFFD instead of failing, so a bad byte never aborts a font.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <cstdint>
#include <string_view>
#include <vector>

namespace inkfont {
    struct INKFONT_EXPORT utf8_decode_result {
        char32_t codepoint;   ///< U+FFFD on invalid input
        int bytes_consumed;   ///< 0 only for empty input
    };

    /**
     * @brief Decode the first codepoint of @p str.
     *
     * Overlong forms, surrogates and values past U+10FFFF decode to U+FFFD.
     */
    [[nodiscard]] INKFONT_EXPORT utf8_decode_result utf8_decode_one(std::string_view str);

    /// UTF-16BE bytes of a UTF-8 string, with surrogate pairs outside the BMP.
    [[nodiscard]] INKFONT_EXPORT std::vector<uint8_t> to_utf16be(std::string_view str);
} // namespace inkfont
