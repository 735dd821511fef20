#pragma once
/**
 * @file trace.hpp
 * @brief Packs heap operations into scrambled 32-bit words for a TracePort.
 *
 * Wire format (every word XORed with the key):
 *   allocate    A1|size>>24            A2|size&0xFF
 *   deallocate  D1|size>>24            D2|size&0xFF
 *   grow        B1|old>>24             B2|(old&0xFF)<<16|new>>16    B3|new&0xFFFF
 *   shrink      C1|old>>24             C2|(old&0xFF)<<16|new>>16    C3|new&0xFFFF
 * Sizes are truncated to 32 bits first. Tracing never changes an allocation outcome.
 *
 * grow/shrink emit only their own three-word record. The allocation and free
 * performed while relocating are not traced, so a grow is B1 B2 B3 on the
 * wire, not B1 B2 B3 A1 A2 D1 D2. Decoders that expect the nested pairs must
 * not wait for them.
 */

#include <cstddef>
#include <cstdint>

#include "kheap/config/constants.hpp"
#include "kheap/obs/observability.hpp"

namespace kheap::obs {

class HeapTracer final {
public:
    /// Disabled tracer.
    HeapTracer() noexcept = default;

    HeapTracer(TracePort* port, std::uint32_t key) noexcept : port_(port), key_(key) {}

    /// True when a port is attached and reports a listener.
    bool enabled() const noexcept { return port_ != nullptr && port_->is_enabled(); }

    // Cheap inline gate; the packing lives out of line.
    void allocate(std::size_t size) const noexcept {
        if (enabled()) trace_allocate(size);
    }
    void deallocate(std::size_t size) const noexcept {
        if (enabled()) trace_deallocate(size);
    }
    void grow(std::size_t old_size, std::size_t new_size) const noexcept {
        if (enabled()) trace_grow(old_size, new_size);
    }
    void shrink(std::size_t old_size, std::size_t new_size) const noexcept {
        if (enabled()) trace_shrink(old_size, new_size);
    }

    TracePort*    port() const noexcept { return port_; }
    std::uint32_t key()  const noexcept { return key_; }

private:
    void trace_allocate(std::size_t size) const noexcept;
    void trace_deallocate(std::size_t size) const noexcept;
    void trace_grow(std::size_t old_size, std::size_t new_size) const noexcept;
    void trace_shrink(std::size_t old_size, std::size_t new_size) const noexcept;

    void emit_pair(std::uint32_t op1, std::uint32_t op2, std::uint32_t size) const noexcept;
    void emit_triple(std::uint32_t op1, std::uint32_t op2, std::uint32_t op3,
                     std::uint32_t old_size, std::uint32_t new_size) const noexcept;

    TracePort*    port_{nullptr};
    std::uint32_t key_{kheap::config::constants::TRACE_KEY_DEFAULT};
};

} // namespace kheap::obs
