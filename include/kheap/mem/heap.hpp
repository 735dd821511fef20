// =============================================================
// File: include/kheap/mem/heap.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "kheap/config/constants.hpp"
#include "kheap/mem/layout.hpp"
#include "kheap/mem/pool.hpp"
#include "kheap/obs/trace.hpp"

namespace kheap::mem {

/**
 * @file heap.hpp
 * @brief Multi-pool dispatcher: binary-search a request onto a size class.
 *
 * Preconditions (supplied by configuration, never checked here):
 *  - pools are sorted ascending by block size;
 *  - their address ranges are ascending and non-overlapping in the same order.
 *  HeapArena builds layouts that satisfy both.
 *
 * Dispatch:
 *  - allocate: lower-bound search by size, then walk upward through larger
 *    pools until one has a free block ("upgrade on exhaustion").
 *  - deallocate: lower-bound search by address (first pool whose edge is
 *    above the pointer).
 *  - grow/shrink: allocate new, copy, free old. Never in place. The old block
 *    is released only after the new one is secured.
 *
 * Every operation is lock-free; nothing here retries after a failure.
 * A Heap is a view: it does not own its pools.
 */
class Heap final {
public:
  /// @brief View @p pools as a heap. Tracing is disabled when @p trace is null.
  explicit Heap(std::span<Pool> pools,
                obs::TracePort* trace = nullptr,
                std::uint32_t trace_key = config::constants::TRACE_KEY_DEFAULT) noexcept
    : pools_(pools), tracer_(trace, trace_key) {}

  /// @brief Index of the smallest pool with block_size >= @p size, or pool_count().
  std::size_t find_by_size(std::size_t size) const noexcept;

  /// @brief Index of the first pool whose edge lies above @p ptr, or pool_count().
  std::size_t find_by_address(const void* ptr) const noexcept;

  /**
   * @brief Allocate a block for @p layout.
   * @return Block with the serving pool's block size as usable length.
   *         Zero-sized layouts yield a non-null dangling pointer of length 0
   *         without touching any pool.
   */
  AllocResult allocate(Layout layout) noexcept;

  /// @brief allocate() followed by zero-filling the whole usable length.
  AllocResult allocate_zeroed(Layout layout) noexcept;

  /// @pre @p ptr came from this heap with @p layout and is not yet freed.
  void deallocate(std::byte* ptr, Layout layout) noexcept;

  /// @brief Move a block to a larger layout, copying old_layout.size() bytes.
  AllocResult grow(std::byte* ptr, Layout old_layout, Layout new_layout) noexcept;

  /// @brief As grow(), with the tail past old_layout.size() zeroed.
  AllocResult grow_zeroed(std::byte* ptr, Layout old_layout, Layout new_layout) noexcept;

  /// @brief Move a block to a smaller layout, copying new_layout.size() bytes.
  AllocResult shrink(std::byte* ptr, Layout old_layout, Layout new_layout) noexcept;

  /// @brief One snapshot per pool, in pool order.
  std::vector<Statistics> statistics() const;

  std::size_t pool_count() const noexcept { return pools_.size(); }
  const Pool& pool(std::size_t index) const noexcept { return pools_[index]; }
  std::span<const Pool> pools() const noexcept { return pools_; }

  const obs::HeapTracer& tracer() const noexcept { return tracer_; }

private:
  AllocResult allocate_untraced(Layout layout) noexcept;
  void deallocate_untraced(std::byte* ptr, Layout layout) noexcept;
  AllocResult relocate(std::byte* ptr, Layout old_layout, Layout new_layout,
                       std::size_t copy_len, bool zeroed) noexcept;

  std::span<Pool> pools_;
  obs::HeapTracer tracer_;
};

} // namespace kheap::mem
