/**
 * @file potrace_tracer.hh
 * @brief Trace engine backed by the external potrace executable.
 *
 * For each cell the bitmap is written as a PBM, potrace is run on it and
 * its SVG output is parsed back:
 *
 * @code
 *   <work>/<stem>.pbm  --potrace-->  <work>/<stem>.svg  --parse-->  raw_path
 *                                    <work>/<stem>.log  (stdout + stderr)
 * @endcode
 *
 * A missing executable, a non-zero exit, a missing output file or an
 * unparsable document are all reported as tracing_failure.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/tracing/trace_engine.hh>
#include <string>
#include <vector>

namespace inkfont {
    class INKFONT_EXPORT potrace_tracer final : public trace_engine {
    public:
        explicit potrace_tracer(tracing_settings settings);

        [[nodiscard]] raw_path trace(const ink_bitmap& bits, const trace_job& job) const override;
        [[nodiscard]] std::string_view name() const noexcept override { return "potrace"; }

        /// Command line for one conversion.
        [[nodiscard]] std::vector<std::string> command(const std::string& input, const std::string& output) const;

    private:
        tracing_settings m_settings;
    };
} // namespace inkfont
