//
// Created by igor on 19/10/2026.
//

#include <inkfont/font_document.hh>
#include <inkfont/errors.hh>
#include <failsafe/failsafe.hh>
#include <cctype>
#include <cstdio>

namespace inkfont {
    std::string_view to_string(glyph_status status) {
        switch (status) {
            case glyph_status::inked: return "inked";
            case glyph_status::empty: return "empty";
            case glyph_status::trace_failed: return "trace_failed";
            case glyph_status::synthetic: return "synthetic";
        }
        return "unknown";
    }

    std::string glyph_name(char32_t codepoint) {
        if (codepoint == U' ') {
            return "space";
        }
        char buf[16];
        std::snprintf(buf, sizeof(buf), "uni%04X", static_cast<unsigned>(codepoint));
        return buf;
    }

    std::string font_info::postscript_name() const {
        std::string out;
        for (char c : family + "-" + style) {
            // PostScript names are printable ASCII without spaces or delimiters.
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_') {
                out.push_back(c);
            }
        }
        return out.substr(0, 63);
    }

    font_document::font_document(font_info info)
        : m_info(std::move(info)) {
        m_notdef.name = ".notdef";
        m_notdef.status = glyph_status::synthetic;
    }

    void font_document::add(glyph_entry entry) {
        const char32_t cp = entry.codepoint;
        THROW_IF(m_glyphs.contains(cp), assembly_error,
                 "duplicate glyph for ", codepoint_name(cp));
        if (entry.name.empty()) {
            entry.name = glyph_name(cp);
        }
        m_glyphs.emplace(cp, std::move(entry));
    }

    void font_document::set_notdef(glyph_entry entry) {
        entry.name = ".notdef";
        entry.codepoint = 0;
        entry.status = glyph_status::synthetic;
        m_notdef = std::move(entry);
    }

    bool font_document::contains(char32_t codepoint) const {
        return m_glyphs.contains(codepoint);
    }

    const glyph_entry* font_document::find(char32_t codepoint) const {
        auto it = m_glyphs.find(codepoint);
        return it == m_glyphs.end() ? nullptr : &it->second;
    }

    std::vector<const glyph_entry*> font_document::glyph_order() const {
        std::vector<const glyph_entry*> out;
        out.reserve(m_glyphs.size() + 1);
        out.push_back(&m_notdef);
        for (const auto& [cp, entry] : m_glyphs) {
            out.push_back(&entry);
        }
        return out;
    }
}  // namespace inkfont
