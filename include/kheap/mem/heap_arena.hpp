// =============================================================
// File: include/kheap/mem/heap_arena.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <memory>
#include <new>

#include "kheap/compat/expected.hpp"
#include "kheap/config/config_loader.hpp"
#include "kheap/mem/heap.hpp"
#include "kheap/mem/pool.hpp"

namespace kheap::mem {

/**
 * @file heap_arena.hpp
 * @brief Owning bundle of backing memory and the pools laid out in it.
 *
 * Construction:
 *  - Use HeapArena::create(config) to build; it validates the configuration,
 *    sorts pools ascending by block size and places them back to back in one
 *    aligned allocation, so address order equals size order.
 *  - All memory is obtained once, at setup. The heap paths never allocate.
 *
 * Moving an arena keeps every block address stable; moving it while other
 * threads use its heap is not supported.
 */
class HeapArena final {
public:
  /**
   * @brief Factory: validates and allocates once (no exceptions).
   * @param cfg   Pool table; order does not matter.
   * @param trace Optional trace port (not owned).
   */
  static kheap_detail::expected<HeapArena, config::ConfigError>
  create(const config::HeapConfig& cfg, obs::TracePort* trace = nullptr) noexcept;

  HeapArena(const HeapArena&)            = delete;
  HeapArena& operator=(const HeapArena&) = delete;
  HeapArena(HeapArena&&) noexcept            = default;
  HeapArena& operator=(HeapArena&&) noexcept = default;

  Heap&       heap() noexcept       { return heap_; }
  const Heap& heap() const noexcept { return heap_; }

  /// First byte of the backing memory (base of the smallest pool).
  std::byte*  base() const noexcept { return memory_.get(); }
  /// Bytes of backing memory.
  std::size_t size() const noexcept { return size_; }

private:
  struct MemoryDeleter {
    void operator()(std::byte* p) const noexcept;
  };
  struct PoolDeleter {
    std::size_t count{0};
    void operator()(Pool* p) const noexcept;
  };

  HeapArena(std::unique_ptr<std::byte[], MemoryDeleter> memory, std::size_t size,
            std::unique_ptr<Pool[], PoolDeleter> pools, std::size_t pool_count,
            obs::TracePort* trace, std::uint32_t trace_key) noexcept;

  std::unique_ptr<std::byte[], MemoryDeleter> memory_;
  std::size_t                                 size_{0};
  std::unique_ptr<Pool[], PoolDeleter>        pools_;
  Heap                                        heap_;
};

} // namespace kheap::mem
