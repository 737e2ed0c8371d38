//
// Created by igor on 19/10/2026.
//

#include <inkfont/config.hh>
#include <inkfont/errors.hh>
#include <inkfont/utils/utf8.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <picojson.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace inkfont {
    namespace {
        constexpr std::array<double, char_class_count> DEFAULT_SCALES = {4.0, 2.8, 3.8, 3.5};

        // Typed access to one JSON object. Absent keys leave the target untouched.
        class section {
        public:
            section(const picojson::value& root, const std::string& name)
                : section(root.is<picojson::object>() ? &root.get<picojson::object>() : nullptr, name, name) {
            }

            section(const section& parent, const std::string& name)
                : section(parent.m_object, name, parent.m_name + "." + name) {
            }

            [[nodiscard]] bool present() const noexcept { return m_object != nullptr; }

            void read(const char* key, double& out) const {
                if (const auto* v = find(key)) {
                    THROW_IF(!v->is<double>(), config_error, key_name(key), " must be a number");
                    out = v->get<double>();
                }
            }

            void read(const char* key, float& out) const {
                double d = out;
                read(key, d);
                out = static_cast<float>(d);
            }

            void read(const char* key, int& out) const {
                if (const auto* v = find(key)) {
                    THROW_IF(!v->is<double>(), config_error, key_name(key), " must be a number");
                    const double d = v->get<double>();
                    THROW_IF(d != std::floor(d) ||
                             d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max(),
                             config_error, key_name(key), " must be an integer, got ", d);
                    out = static_cast<int>(d);
                }
            }

            void read(const char* key, unsigned& out) const {
                int i = static_cast<int>(out);
                read(key, i);
                THROW_IF(i < 0, config_error, key_name(key), " must not be negative");
                out = static_cast<unsigned>(i);
            }

            void read(const char* key, std::optional<double>& out) const {
                if (find(key)) {
                    double d = 0.0;
                    read(key, d);
                    out = d;
                }
            }

            void read(const char* key, bool& out) const {
                if (const auto* v = find(key)) {
                    THROW_IF(!v->is<bool>(), config_error, key_name(key), " must be a boolean");
                    out = v->get<bool>();
                }
            }

            void read(const char* key, std::string& out) const {
                if (const auto* v = find(key)) {
                    THROW_IF(!v->is<std::string>(), config_error, key_name(key), " must be a string");
                    out = v->get<std::string>();
                }
            }

            void read(const char* key, std::filesystem::path& out) const {
                std::string s = out.string();
                read(key, s);
                out = s;
            }

            [[nodiscard]] std::string key_name(const char* key) const {
                return m_name + "." + key;
            }

            [[nodiscard]] std::vector<std::string> keys() const {
                std::vector<std::string> out;
                if (m_object) {
                    for (const auto& [key, value] : *m_object) {
                        out.push_back(key);
                    }
                }
                return out;
            }

        private:
            section(const picojson::object* parent, const std::string& key, std::string full_name)
                : m_name(std::move(full_name)) {
                if (!parent) {
                    return;
                }
                auto it = parent->find(key);
                if (it == parent->end()) {
                    return;
                }
                THROW_IF(!it->second.is<picojson::object>(), config_error,
                         "section '", m_name, "' must be an object");
                m_object = &it->second.get<picojson::object>();
            }

            [[nodiscard]] const picojson::value* find(const char* key) const {
                if (!m_object) {
                    return nullptr;
                }
                auto it = m_object->find(key);
                return it == m_object->end() ? nullptr : &it->second;
            }

            std::string m_name;
            const picojson::object* m_object = nullptr;
        };

        void read_grid(const section& s, grid_layout& g) {
            s.read("rows", g.rows);
            s.read("columns", g.columns);
            s.read("cell_width", g.cell_width);
            s.read("cell_height", g.cell_height);
            s.read("margin", g.margin);
            s.read("border_thickness", g.border_thickness);
            s.read("safety_margin", g.safety_margin);
            s.read("baseline_ratio", g.baseline_ratio);
        }

        char32_t override_codepoint(const std::string& key, const std::string& where) {
            const utf8_decode_result d = utf8_decode_one(key);
            THROW_IF(d.bytes_consumed <= 0 || static_cast<std::size_t>(d.bytes_consumed) != key.size() ||
                     d.codepoint == U'\uFFFD',
                     config_error, where, ": override key '", key, "' must be exactly one character");
            return d.codepoint;
        }

        scale_override read_override(const section& s) {
            scale_override o;
            s.read("scale_factor", o.scale_factor);
            s.read("vertical_offset", o.vertical_offset);
            return o;
        }

        std::string read_text(const std::filesystem::path& path, const char* what) {
            std::ifstream file(path, std::ios::binary);
            THROW_IF(!file, config_error, "cannot open ", what, " file: ", path.string());
            std::ostringstream text;
            text << file.rdbuf();
            THROW_IF(file.bad(), config_error, "cannot read ", what, " file: ", path.string());
            return text.str();
        }

        void read_classes(const picojson::value& root, generator_config& cfg) {
            const section classes(root, "classes");
            if (!classes.present()) {
                return;
            }
            for (std::size_t i = 0; i < char_class_count; ++i) {
                const auto cls = static_cast<char_class>(i);
                const section s(classes, std::string(to_string(cls)));

                scale_entry scale = cfg.scales.at(cls);
                s.read("scale_factor", scale.scale_factor);
                s.read("vertical_offset", scale.vertical_offset);
                cfg.scales.set(cls, scale);

                auto& spacing = cfg.spacing.entries[i];
                s.read("left_bearing", spacing.left_bearing);
                s.read("right_bearing", spacing.right_bearing);
                s.read("min_advance", spacing.min_advance);

                const section overrides(s, "overrides");
                for (const auto& key : overrides.keys()) {
                    const char32_t cp = override_codepoint(key, s.key_name("overrides"));
                    THROW_IF(cfg.scales.find_override(cp), config_error, "character '", key,
                             "' is overridden in more than one class");
                    cfg.scales.set_override(cp, read_override(section(overrides, key)));
                }
            }

            // Unknown class names are most likely typos.
            for (const auto& name : classes.keys()) {
                THROW_IF(!parse_char_class(name), config_error, "unknown character class '", name, "'");
            }
        }

        void read_font(const section& s, generator_config& cfg) {
            s.read("name", cfg.font.name);
            s.read("version", cfg.font.version);
            s.read("copyright", cfg.font.copyright);
            s.read("space_width", cfg.font.space_width);
            s.read("units_per_em", cfg.design.units_per_em);
            s.read("ascent", cfg.design.ascent);
            s.read("descent", cfg.design.descent);
            s.read("pixels_per_unit", cfg.design.pixels_per_unit);
            s.read("center_line", cfg.design.center_line);
            s.read("monospace_advance", cfg.spacing.monospace_advance);

            std::string mode;
            s.read("spacing_mode", mode);
            if (mode == "proportional") {
                cfg.spacing.mode = spacing_mode::proportional;
            } else if (mode == "monospace") {
                cfg.spacing.mode = spacing_mode::monospace;
            } else {
                THROW_IF(!mode.empty(), config_error, "unknown spacing mode '", mode, "'");
            }
        }

        void read_tracing(const section& s, tracing_settings& t) {
            std::string engine;
            s.read("engine", engine);
            if (engine == "builtin") {
                t.engine = tracer_kind::builtin;
            } else if (engine == "potrace") {
                t.engine = tracer_kind::potrace;
            } else {
                THROW_IF(!engine.empty(), config_error, "unknown tracing engine '", engine, "'");
            }
            s.read("executable", t.executable);
            s.read("turnpolicy", t.turnpolicy);
            s.read("alphamax", t.alphamax);
            s.read("opttolerance", t.opttolerance);
        }

        void read_compiler(const section& s, compiler_settings& c) {
            std::string engine;
            s.read("engine", engine);
            if (engine == "truetype") {
                c.engine = compiler_kind::truetype;
            } else if (engine == "fontforge") {
                c.engine = compiler_kind::fontforge;
            } else {
                THROW_IF(!engine.empty(), config_error, "unknown compiler engine '", engine, "'");
            }
            s.read("executable", c.executable);
        }
    }

    scale_config::scale_config() {
        for (std::size_t i = 0; i < char_class_count; ++i) {
            m_entries[i].scale_factor = DEFAULT_SCALES[i];
        }
    }

    const scale_entry& scale_config::at(char_class cls) const noexcept {
        return m_entries[static_cast<std::size_t>(cls)];
    }

    void scale_config::set(char_class cls, const scale_entry& entry) noexcept {
        m_entries[static_cast<std::size_t>(cls)] = entry;
    }

    void scale_override::merge(const scale_override& other) noexcept {
        if (other.scale_factor) {
            scale_factor = other.scale_factor;
        }
        if (other.vertical_offset) {
            vertical_offset = other.vertical_offset;
        }
    }

    scale_entry scale_config::resolve(char32_t codepoint, char_class cls) const {
        scale_entry e = at(cls);
        if (const scale_override* o = find_override(codepoint)) {
            e.scale_factor = o->scale_factor.value_or(e.scale_factor);
            e.vertical_offset = o->vertical_offset.value_or(e.vertical_offset);
        }
        return e;
    }

    void scale_config::set_override(char32_t codepoint, const scale_override& entry) {
        m_overrides[codepoint].merge(entry);
    }

    const scale_override* scale_config::find_override(char32_t codepoint) const {
        auto it = m_overrides.find(codepoint);
        return it == m_overrides.end() ? nullptr : &it->second;
    }

    generator_config default_config() {
        return {};
    }

    generator_config parse_config(std::string_view json) {
        picojson::value root;
        std::string err;
        picojson::parse(root, json.begin(), json.end(), &err);
        THROW_IF(!err.empty(), config_error, "malformed configuration: ", err);
        THROW_IF(!root.is<picojson::object>(), config_error, "configuration root must be an object");

        generator_config cfg = default_config();

        read_grid(section(root, "grid"), cfg.grid);
        read_classes(root, cfg);

        const section extraction(root, "extraction");
        extraction.read("threshold", cfg.extraction.threshold);
        extraction.read("min_ink_pixels", cfg.extraction.min_ink_pixels);

        read_tracing(section(root, "tracing"), cfg.tracing);
        read_font(section(root, "font"), cfg);
        read_compiler(section(root, "compiler"), cfg.compiler);

        const section templ(root, "template");
        templ.read("raster_scale", cfg.templ.raster_scale);
        templ.read("label_gray", cfg.templ.label_gray);
        templ.read("guide_gray", cfg.templ.guide_gray);
        templ.read("label_font", cfg.templ.label_font);
        templ.read("label_size", cfg.templ.label_size);

        const section pipeline(root, "pipeline");
        pipeline.read("workers", cfg.pipeline.workers);
        pipeline.read("work_root", cfg.pipeline.work_root);
        pipeline.read("keep_intermediates", cfg.pipeline.keep_intermediates);

        validate(cfg);
        return cfg;
    }

    generator_config load_config(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            LOG_INFO("configuration ", path.string(), " not found, using defaults");
            return default_config();
        }

        const std::string text = read_text(path, "configuration");
        LOG_DEBUG("loading configuration from ", path.string());
        return parse_config(text);
    }

    void parse_character_overrides(std::string_view json, scale_config& scales) {
        picojson::value root;
        std::string err;
        picojson::parse(root, json.begin(), json.end(), &err);
        THROW_IF(!err.empty(), config_error, "malformed character overrides: ", err);
        THROW_IF(!root.is<picojson::object>(), config_error, "character overrides must be an object");

        for (const auto& entry : root.get<picojson::object>()) {
            const char32_t cp = override_codepoint(entry.first, "character overrides");
            scales.set_override(cp, read_override(section(root, entry.first)));
        }
    }

    void load_character_overrides(const std::filesystem::path& path, generator_config& config) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            LOG_WARN("character overrides ", path.string(), " not found, class settings apply unchanged");
            return;
        }

        generator_config merged = config;
        parse_character_overrides(read_text(path, "character overrides"), merged.scales);
        validate(merged);
        LOG_INFO("applied ", merged.scales.overrides().size(), " character overrides from ", path.string());
        config = std::move(merged);
    }

    void validate(const generator_config& config) {
        const auto& g = config.grid;
        THROW_IF(g.columns <= 0 || g.rows < 0, config_error,
                 "grid needs positive columns and non-negative rows");
        THROW_IF(g.cell_width <= 0 || g.cell_height <= 0, config_error,
                 "cell size must be positive, got ", g.cell_width, "x", g.cell_height);
        THROW_IF(g.margin < 0 || g.border_thickness < 0 || g.safety_margin < 0, config_error,
                 "margin, border thickness and safety margin must not be negative");
        THROW_IF(2 * g.inset() >= std::min(g.cell_width, g.cell_height), config_error,
                 "border thickness and safety margin leave no interior in a cell");
        THROW_IF(!(g.baseline_ratio > 0.0 && g.baseline_ratio <= 1.0), config_error,
                 "baseline_ratio must be in (0, 1], got ", g.baseline_ratio);

        const int threshold = config.extraction.threshold;
        THROW_IF(threshold < 1 || threshold > 255, config_error,
                 "threshold must be in 1..255, got ", threshold);
        THROW_IF(config.extraction.min_ink_pixels < 0, config_error, "min_ink_pixels must not be negative");

        for (std::size_t i = 0; i < char_class_count; ++i) {
            const auto cls = static_cast<char_class>(i);
            const double s = config.scales.at(cls).scale_factor;
            THROW_IF(!(s > 0.0) || !std::isfinite(s), config_error,
                     "scale_factor of class ", to_string(cls), " must be positive, got ", s);
            THROW_IF(config.spacing.at(cls).min_advance < 0, config_error,
                     "min_advance of class ", to_string(cls), " must not be negative");
        }

        for (const auto& [cp, o] : config.scales.overrides()) {
            THROW_IF(o.scale_factor && (!(*o.scale_factor > 0.0) || !std::isfinite(*o.scale_factor)), config_error,
                     "scale_factor override of ", codepoint_name(cp), " must be positive, got ", *o.scale_factor);
            THROW_IF(o.vertical_offset && !std::isfinite(*o.vertical_offset), config_error,
                     "vertical_offset override of ", codepoint_name(cp), " must be finite");
        }

        const auto& d = config.design;
        THROW_IF(d.units_per_em < 16 || d.units_per_em > 16384, config_error,
                 "units_per_em must be in 16..16384, got ", d.units_per_em);
        THROW_IF(d.ascent < 0 || d.ascent > 32767 || d.descent < 0 || d.descent > 32767, config_error,
                 "ascent and descent must be in 0..32767");
        THROW_IF(!(d.pixels_per_unit > 0.0), config_error, "pixels_per_unit must be positive");
        THROW_IF(config.font.space_width < 0 || config.font.space_width > 65535, config_error,
                 "space_width must be in 0..65535");
        THROW_IF(config.spacing.monospace_advance <= 0 || config.spacing.monospace_advance > 65535,
                 config_error, "monospace_advance must be in 1..65535");
        THROW_IF(config.font.name.empty(), config_error, "font name must not be empty");

        const auto& t = config.templ;
        THROW_IF(!(t.raster_scale >= 1.0), config_error, "raster_scale must be at least 1, got ", t.raster_scale);
        THROW_IF(t.label_gray <= threshold || t.label_gray > 255, config_error,
                 "label_gray ", t.label_gray, " would read back as ink with threshold ", threshold);
        THROW_IF(t.guide_gray <= threshold || t.guide_gray > 255, config_error,
                 "guide_gray ", t.guide_gray, " would read back as ink with threshold ", threshold);
        THROW_IF(!(t.label_size > 0.0f), config_error, "label_size must be positive");

        THROW_IF(!(config.tracing.alphamax >= 0.0) || !(config.tracing.opttolerance >= 0.0), config_error,
                 "alphamax and opttolerance must not be negative");
    }
}  // namespace inkfont
