//
// Created by igor on 19/10/2026.
//

#include <inkfont/tracing/potrace_tracer.hh>
#include <inkfont/tracing/potrace_svg.hh>
#include <inkfont/errors.hh>
#include <inkfont/utils/process.hh>
#include <inkfont/utils/work_directory.hh>
#include <failsafe/failsafe.hh>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

namespace inkfont {
    namespace {
        std::string number(double v) {
            std::ostringstream s;
            s << v;
            return s.str();
        }
    }

    potrace_tracer::potrace_tracer(tracing_settings settings)
        : m_settings(std::move(settings)) {
    }

    std::vector<std::string> potrace_tracer::command(const std::string& input, const std::string& output) const {
        return {
            m_settings.executable,
            "--svg",
            "--turnpolicy", m_settings.turnpolicy,
            "--alphamax", number(m_settings.alphamax),
            "--opttolerance", number(m_settings.opttolerance),
            "-o", output,
            input
        };
    }

    raw_path potrace_tracer::trace(const ink_bitmap& bits, const trace_job& job) const {
        // Without a job directory the engine works in a private one.
        std::unique_ptr<work_directory> own;
        const work_directory* work = job.work;
        if (!work) {
            try {
                own = std::make_unique<work_directory>();
            } catch (const std::runtime_error& e) {
                THROW(tracing_failure, "potrace: ", e.what());
            }
            work = own.get();
        }

        const auto pbm_path = work->file(job.stem, ".pbm");
        const auto svg_path = work->file(job.stem, ".svg");
        const auto log_path = work->file(job.stem, ".log");

        {
            const auto pbm = bits.to_pbm();
            std::ofstream out(pbm_path, std::ios::binary);
            THROW_IF(!out, tracing_failure, "cannot create ", pbm_path.string());
            out.write(reinterpret_cast<const char*>(pbm.data()), static_cast<std::streamsize>(pbm.size()));
            THROW_IF(!out, tracing_failure, "cannot write ", pbm_path.string());
        }

        process_result result;
        try {
            result = run_process(command(pbm_path.string(), svg_path.string()), log_path);
        } catch (const std::runtime_error& e) {
            THROW(tracing_failure, "potrace: ", e.what());
        }
        THROW_IF(!result.ok(), tracing_failure,
                 m_settings.executable, " failed (exit ", result.exit_code, ", signal ", result.signal, "): ",
                 result.output_tail);

        std::ifstream in(svg_path, std::ios::binary);
        THROW_IF(!in, tracing_failure, "potrace produced no output at ", svg_path.string());
        const std::string svg((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        return parse_potrace_svg(svg, bits.width(), bits.height());
    }
}  // namespace inkfont
