#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: a write-only trace port + statistics rendering.
 * @details The default backend prints to stdout for bring-up. On a target the
 *          port maps to a debug channel (e.g. an ITM/SWO stimulus port).
 */

#include <cstdint>
#include <span>
#include <string>

#include "kheap/mem/pool.hpp"

namespace kheap::obs {

    /** @class TracePort
     *  @brief One-directional word sink consumed by the heap tracer.
     *
     *  Implementations must not allocate from the heap they observe and must
     *  never fail visibly: the channel is best-effort.
     */
    class TracePort {
    public:
        virtual ~TracePort() = default;
        /// Whether a listener is attached. Checked before every traced operation.
        virtual bool is_enabled() const noexcept = 0;
        /// Emit one already scrambled 32-bit word.
        virtual void write(std::uint32_t word) noexcept = 0;
    };

    /// Process-wide printf-backed port (always enabled).
    TracePort* make_stdout_trace_port();

    /// Render a fixed-width table of per-pool statistics, one pool per line.
    std::string format_statistics(std::span<const kheap::mem::Statistics> stats);

} // namespace kheap::obs
