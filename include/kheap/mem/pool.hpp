// =============================================================
// File: include/kheap/mem/pool.hpp
// =============================================================
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace kheap::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/// @brief Per-pool snapshot for monitoring.
struct Statistics {
  std::size_t block_size{0}; ///< Bytes per block
  std::size_t capacity{0};   ///< Total blocks
  std::size_t remain{0};     ///< Blocks not currently allocated (diagnostic only)
};

/**
 * @file pool.hpp
 * @brief One size class: a fixed range of equally sized blocks with a
 *        lock-free free list and a lock-free bump cursor.
 *
 * Design:
 *  - Block size, capacity and address range are fixed at construction.
 *  - Never-touched blocks are handed out by advancing `uninit_` towards `edge_`.
 *  - Freed blocks are pushed onto an intrusive Treiber stack; the link to the
 *    next free block is stored in the first pointer-sized word of the block.
 *  - allocate() and deallocate() never block. Contended CAS loops retry
 *    without backoff and without fairness.
 *
 * Memory ordering:
 *  - Free-list head: acquire loads, acq_rel CAS. The link written into a block
 *    happens-before any thread that pops that block reads it.
 *  - Bump cursor: relaxed. No payload travels with it.
 *  - remain_: relaxed, never read by allocation logic. Concurrent readers may
 *    observe stale values.
 *
 * The head is one 64-bit word: the index of the top block in the low half and
 * a generation in the high half, bumped by every successful push and pop. A
 * pop whose head was popped and pushed back in the meantime therefore fails
 * its CAS instead of installing a stale link. Capacity is limited to
 * config::constants::MAX_POOL_CAPACITY so every index fits the low half.
 */
class Pool final {
  static_assert(std::atomic<std::uint64_t>::is_always_lock_free,
                "std::atomic<std::uint64_t> must be lock-free on this target");
  static_assert(std::atomic<std::uintptr_t>::is_always_lock_free,
                "std::atomic<std::uintptr_t> must be lock-free on this target");

public:
  /// @brief Describe @p capacity blocks of @p block_size bytes starting at @p base.
  /// No memory is touched; the range is only written when blocks are freed.
  /// @pre capacity <= config::constants::MAX_POOL_CAPACITY
  Pool(std::uintptr_t base, std::size_t block_size, std::size_t capacity) noexcept;

  Pool(const Pool&)            = delete;
  Pool& operator=(const Pool&) = delete;

  /// @brief Take one block, from the free list first, then from untouched memory.
  /// @return Block address, or nullptr when the pool is exhausted.
  [[nodiscard]] std::byte* allocate() noexcept;

  /// @brief Return a block to the free list.
  /// @pre @p ptr was returned by allocate() on this pool and is currently allocated.
  void deallocate(std::byte* ptr) noexcept;

  /// @brief Snapshot of size, capacity and remaining blocks.
  Statistics statistics() const noexcept;

  std::size_t   block_size() const noexcept { return block_size_; }
  std::size_t   capacity()   const noexcept { return capacity_; }
  std::uintptr_t base()      const noexcept { return base_; }
  /// Address of the byte past the last block.
  std::uintptr_t edge()      const noexcept { return edge_; }

  /// @brief Largest power of two dividing every block address of this pool.
  std::size_t alignment() const noexcept;

  bool contains(const void* ptr) const noexcept {
    const auto addr = reinterpret_cast<std::uintptr_t>(ptr);
    return addr >= base_ && addr < edge_;
  }

private:
  /// Free-list index meaning "no block".
  static constexpr std::uint32_t kNoBlock = 0xFFFFFFFFU;

  std::byte* alloc_free() noexcept;
  std::byte* alloc_uninit() noexcept;

  std::byte*    block_at(std::uint32_t index) const noexcept;
  std::uint32_t index_of(const std::byte* ptr) const noexcept;

  // Read-only after construction
  std::size_t    block_size_;
  std::size_t    capacity_;
  std::uintptr_t base_;
  std::uintptr_t edge_;

  // Hot atomics on their own line so neighbouring pools never share one
  alignas(kCacheLine) std::atomic<std::uint64_t>  free_{kNoBlock}; ///< Free-list head: generation << 32 | index
  std::atomic<std::uintptr_t>                     uninit_;         ///< Bump cursor in [base_, edge_]
  std::atomic<std::size_t>                        remain_;         ///< Diagnostic counter
};

} // namespace kheap::mem
