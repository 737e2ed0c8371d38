//
// Created by igor on 19/10/2026.
//

#include <inkfont/compile/font_compiler.hh>
#include <inkfont/compile/fontforge_compiler.hh>
#include <inkfont/compile/truetype_compiler.hh>

namespace inkfont {
    font_compiler::~font_compiler() = default;

    std::unique_ptr<font_compiler> make_font_compiler(const compiler_settings& settings) {
        switch (settings.engine) {
            case compiler_kind::fontforge:
                return std::make_unique<fontforge_compiler>(settings);
            case compiler_kind::truetype:
                break;
        }
        return std::make_unique<truetype_compiler>();
    }
}  // namespace inkfont
