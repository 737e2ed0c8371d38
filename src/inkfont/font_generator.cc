//
// Created by igor on 19/10/2026.
//

#include <inkfont/font_generator.hh>
#include <inkfont/errors.hh>
#include <inkfont/glyph_normalizer.hh>
#include <inkfont/metrics.hh>
#include <inkfont/region_extractor.hh>
#include <inkfont/template_renderer.hh>
#include <inkfont/tracing/vectorization_adapter.hh>
#include <inkfont/ttf_reader.hh>
#include <inkfont/utils/work_directory.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/logger.hh>
#include <algorithm>
#include <cstdio>
#include <optional>

namespace inkfont {
    namespace {
        std::optional<ttf_reader> load_label_font(const std::filesystem::path& path) {
            if (path.empty()) {
                return std::nullopt;
            }
            try {
                ttf_reader reader = ttf_reader::load(path);
                if (reader.is_valid()) {
                    return std::optional<ttf_reader>(std::move(reader));
                }
                LOG_WARN("label font ", path.string(), " is not a TrueType font; template labels are skipped");
            } catch (const std::runtime_error& e) {
                LOG_WARN("cannot load label font: ", e.what(), "; template labels are skipped");
            }
            return std::nullopt;
        }
    }

    std::size_t generation_result::count(glyph_status status) const noexcept {
        return static_cast<std::size_t>(std::count_if(glyphs.begin(), glyphs.end(),
                                                       [status](const glyph_report& g) {
                                                           return g.status == status;
                                                       }));
    }

    std::string cell_stem(const character_spec& spec) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "cell_%03zu_", spec.cell_index);
        return buf + codepoint_name(spec.codepoint);
    }

    font_generator::font_generator(generator_config config)
        : m_config(std::move(config)) {
        validate(m_config);
        m_tracer = make_trace_engine(m_config.tracing);
        m_compiler = make_font_compiler(m_config.compiler);
    }

    font_generator::font_generator(generator_config config, std::unique_ptr<trace_engine> tracer,
                                   std::unique_ptr<font_compiler> compiler)
        : m_config(std::move(config)),
          m_tracer(std::move(tracer)),
          m_compiler(std::move(compiler)) {
        validate(m_config);
        ENFORCE(m_tracer != nullptr);
        ENFORCE(m_compiler != nullptr);
    }

    generation_result font_generator::generate(const std::filesystem::path& source_path, const character_set& set,
                                               const std::filesystem::path& output,
                                               const cancellation_token& cancel) const {
        // Layout problems are reported before the image is even decoded.
        validate(fit_rows(m_config.grid, set), set);
        const gray_image source = gray_image::load(source_path);
        return generate(source, set, output, cancel);
    }

    generation_result font_generator::generate(const gray_image& source, const character_set& set,
                                               const std::filesystem::path& output,
                                               const cancellation_token& cancel) const {
        const grid_layout grid = fit_rows(m_config.grid, set);
        validate(grid, set);

        const region_extractor extractor(grid, m_config.extraction);
        const prepared_source prepared = extractor.prepare(source);

        LOG_INFO("generating ", set.size(), " glyphs from a ", source.width(), "x", source.height(),
                 " image (grid ", grid.columns, "x", grid.rows, ", scale ", prepared.scale(),
                 ", tracer ", m_tracer->name(), ")");

        work_directory work(m_config.pipeline.work_root);
        const bool keep = m_config.pipeline.keep_intermediates;
        work.keep(keep);
        if (keep) {
            LOG_INFO("keeping intermediates in ", work.path().string());
        }

        const vectorization_adapter adapter(*m_tracer);
        const glyph_normalizer normalizer(m_config.scales, m_config.design);
        const metrics_calculator metrics(m_config.spacing, m_config.design);

        auto process = [&](std::size_t i) -> glyph_result {
            const character_spec& spec = set.at(i);
            extracted_cell cell = extractor.extract(prepared, spec);

            glyph_result r;
            r.cell_index = spec.cell_index;
            r.codepoint = spec.codepoint;
            r.ink_pixels = cell.ink_pixels;

            if (cell.empty()) {
                r.status = glyph_status::empty;
                r.metrics = metrics.measure(r.outline, spec.cls);
                LOG_DEBUG("cell ", spec.cell_index, " ", codepoint_name(spec.codepoint), ": empty (",
                          cell.ink_pixels, " ink pixels)");
                return r;
            }

            const std::string stem = cell_stem(spec);
            if (keep) {
                try {
                    cell.image->bits.to_image().save_png(work.file(stem, ".png"));
                } catch (const std::runtime_error& e) {
                    LOG_WARN("cannot save cell bitmap: ", e.what());
                }
            }

            vectorized v = adapter.vectorize(cell.image->bits, trace_job{&work, stem});
            r.outline = normalizer.normalize(v.path, cell.image->frame, spec);
            r.metrics = metrics.measure(r.outline, spec.cls);
            if (v.failed) {
                r.status = glyph_status::trace_failed;
                r.failure = std::move(v.failure);
            } else {
                r.status = r.outline.empty() ? glyph_status::empty : glyph_status::inked;
            }

            LOG_DEBUG("cell ", spec.cell_index, " ", codepoint_name(spec.codepoint), ": ", to_string(r.status),
                      ", ", r.outline.contours.size(), " contours, advance ", r.metrics.advance_width);
            return r;
        };

        auto slots = parallel_map(set.size(), m_config.pipeline.workers, cancel, process);

        const auto done = static_cast<std::size_t>(std::count_if(slots.begin(), slots.end(),
                                                                 [](const auto& s) { return s.has_value(); }));
        THROW_IF(cancel.cancelled(), cancelled_error,
                 "font generation cancelled after ", done, " of ", set.size(), " cells");

        std::vector<glyph_result> results;
        results.reserve(slots.size());
        for (auto& slot : slots) {
            if (slot) {
                results.push_back(std::move(*slot));
            }
        }

        const font_assembler assembler(m_config.font, m_config.design);
        const font_document doc = assembler.assemble(set, results);
        assembler.emit(doc, set, *m_compiler, output, compile_job{&work});

        generation_result out;
        out.output = output;
        out.glyphs.reserve(results.size());
        for (auto& r : results) {
            out.glyphs.push_back({r.codepoint, r.cell_index, r.status, r.ink_pixels, std::move(r.failure)});
        }

        LOG_INFO("font ", output.string(), ": ", out.count(glyph_status::inked), " inked, ",
                 out.count(glyph_status::empty), " empty, ", out.count(glyph_status::trace_failed),
                 " failed to trace");
        return out;
    }

    void font_generator::write_template(const character_set& set, const std::filesystem::path& svg_path,
                                        const std::filesystem::path& png_path) const {
        const grid_layout grid = fit_rows(m_config.grid, set);
        const template_renderer renderer(grid, m_config.templ);

        if (!svg_path.empty()) {
            renderer.write_svg(svg_path, set);
            LOG_INFO("wrote template ", svg_path.string());
        }
        if (!png_path.empty()) {
            const std::optional<ttf_reader> label_font = load_label_font(m_config.templ.label_font);
            renderer.write_png(png_path, set, label_font ? &*label_font : nullptr);
            LOG_INFO("wrote template ", png_path.string(), " (", renderer.raster_width(), "x",
                     renderer.raster_height(), ")");
        }
    }
}  // namespace inkfont
