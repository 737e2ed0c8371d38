/**
 * @file pixel_edge_tracer.hh
 * @brief Built-in tracer that follows the exact pixel boundary.
 *
 * Every unit edge between an ink pixel and a paper pixel (or the bitmap
 * border) becomes a directed edge with the ink on its right-hand side. The
 * edges are linked into closed loops and runs of collinear edges are merged,
 * so a filled rectangle traces to exactly four corners.
 *
 * @code
 *   (0,0)                 outer loop: clockwise on screen
 *     +--->--->--->+
 *     |############|      hole loop:  counter-clockwise on screen
 *     ^###+-<-+####v
 *     |###v   ^####|
 *     |###+->-+####|
 *     +<---<---<---+
 * @endcode
 *
 * Where two ink pixels touch only at a corner the tracer keeps them apart
 * (4-connectivity): the walk turns right, staying on the pixel it came from.
 *
 * @author Igor
 * @date 19/10/2026
 */

#pragma once

#include <inkfont/export.h>
#include <inkfont/tracing/trace_engine.hh>

namespace inkfont {
    class INKFONT_EXPORT pixel_edge_tracer final : public trace_engine {
    public:
        [[nodiscard]] raw_path trace(const ink_bitmap& bits, const trace_job& job) const override;
        [[nodiscard]] std::string_view name() const noexcept override { return "builtin"; }
    };
} // namespace inkfont
