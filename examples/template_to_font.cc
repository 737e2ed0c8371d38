//
// Created by igor on 19/10/2026.
//
// Template to font round trip using inkfont
//
// 1. "template" renders the blank template for a character set
// 2. the user draws into the PNG (or prints the SVG and scans it back)
// 3. "font" reads the filled template back and writes a TrueType font
//
// Usage:
//   template_to_font template <config.json> <out.svg> <out.png> [classes]
//   template_to_font font     <config.json> <scan.png> <out.ttf> [classes] [overrides.json]
//
// classes is a comma separated list of upper, lower, digit, symbol
// (default: all of them). The same list must be used for both steps.
// overrides.json maps single characters to their own scale_factor and
// vertical_offset, e.g. {"g": {"vertical_offset": -150}}.
//

#include <inkfont/errors.hh>
#include <inkfont/font_generator.hh>
#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace inkfont;

namespace {
    character_set parse_classes(const std::string& list) {
        std::vector<char_class> classes;
        std::size_t pos = 0;
        while (pos <= list.size()) {
            const std::size_t comma = std::min(list.find(',', pos), list.size());
            const std::string name = list.substr(pos, comma - pos);
            const auto cls = parse_char_class(name);
            if (!cls) {
                throw config_error("unknown character class '" + name + "'");
            }
            classes.push_back(*cls);
            pos = comma + 1;
        }
        return character_set::select(classes);
    }

    void usage(const char* argv0) {
        std::cerr << "Usage: " << argv0 << " template <config.json> <out.svg> <out.png> [classes]\n";
        std::cerr << "       " << argv0 << " font <config.json> <scan.png> <out.ttf> [classes] [overrides.json]\n";
        std::cerr << "classes: comma separated list of upper, lower, digit, symbol\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 5) {
        usage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    try {
        generator_config config = load_config(argv[2]);
        if (command == "font" && argc > 6) {
            load_character_overrides(argv[6], config);
        }
        const font_generator generator(std::move(config));
        const character_set set = argc > 5 ? parse_classes(argv[5]) : character_set::standard();

        if (command == "template") {
            generator.write_template(set, argv[3], argv[4]);
            std::cout << "Wrote " << argv[3] << " and " << argv[4] << " (" << set.size() << " cells)\n";
            return 0;
        }
        if (command == "font") {
            const generation_result result = generator.generate(std::filesystem::path(argv[3]), set, argv[4]);
            std::cout << "Wrote " << result.output.string() << ": "
                      << result.count(glyph_status::inked) << " drawn, "
                      << result.count(glyph_status::empty) << " blank, "
                      << result.count(glyph_status::trace_failed) << " failed to trace\n";
            for (const auto& g : result.glyphs) {
                if (g.status == glyph_status::trace_failed) {
                    std::cout << "  " << codepoint_name(g.codepoint) << ": " << g.failure << '\n';
                }
            }
            return 0;
        }
    } catch (const inkfont_error& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << '\n';
        return 3;
    }

    usage(argv[0]);
    return 1;
}
