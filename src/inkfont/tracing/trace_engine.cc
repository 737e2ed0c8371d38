//
// Created by igor on 19/10/2026.
//

#include <inkfont/tracing/trace_engine.hh>
#include <inkfont/tracing/pixel_edge_tracer.hh>
#include <inkfont/tracing/potrace_tracer.hh>

namespace inkfont {
    trace_engine::~trace_engine() = default;

    std::unique_ptr<trace_engine> make_trace_engine(const tracing_settings& settings) {
        switch (settings.engine) {
            case tracer_kind::potrace:
                return std::make_unique<potrace_tracer>(settings);
            case tracer_kind::builtin:
                break;
        }
        return std::make_unique<pixel_edge_tracer>();
    }
}  // namespace inkfont
