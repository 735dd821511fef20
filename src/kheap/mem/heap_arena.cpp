// =============================================================
// File: src/kheap/mem/heap_arena.cpp
// =============================================================
#include "kheap/mem/heap_arena.hpp"

#include <algorithm>
#include <cstdint>
#include <span>
#include <vector>

namespace kheap::mem {

using config::ConfigError;

void HeapArena::MemoryDeleter::operator()(std::byte* p) const noexcept {
  ::operator delete(p, std::align_val_t(config::constants::ARENA_ALIGN));
}

void HeapArena::PoolDeleter::operator()(Pool* p) const noexcept {
  std::destroy_n(p, count);
  ::operator delete(p, std::align_val_t(alignof(Pool)));
}

HeapArena::HeapArena(std::unique_ptr<std::byte[], MemoryDeleter> memory, std::size_t size,
                     std::unique_ptr<Pool[], PoolDeleter> pools, std::size_t pool_count,
                     obs::TracePort* trace, std::uint32_t trace_key) noexcept
  : memory_(std::move(memory)),
    size_(size),
    pools_(std::move(pools)),
    heap_(std::span<Pool>(pools_.get(), pool_count), trace, trace_key)
{}

kheap_detail::expected<HeapArena, ConfigError>
HeapArena::create(const config::HeapConfig& cfg, obs::TracePort* trace) noexcept {
  if (auto ok = config::validate(cfg); !ok) {
    return kheap_detail::unexpected<ConfigError>(ok.error());
  }
  const std::size_t total = *config::pools_size(cfg);

  // Size order is address order once the pools are laid out back to back.
  std::vector<config::PoolConfig> sorted;
  try {
    sorted = cfg.pools;
  } catch (const std::bad_alloc&) {
    return kheap_detail::unexpected<ConfigError>(ConfigError::AllocationFailed);
  }
  std::sort(sorted.begin(), sorted.end(),
            [](const config::PoolConfig& a, const config::PoolConfig& b) {
              return a.block_size < b.block_size;
            });

  std::unique_ptr<std::byte[], MemoryDeleter> memory(
    static_cast<std::byte*>(::operator new(total,
                                           std::align_val_t(config::constants::ARENA_ALIGN),
                                           std::nothrow)));
  if (!memory) {
    return kheap_detail::unexpected<ConfigError>(ConfigError::AllocationFailed);
  }

  const std::size_t n = sorted.size();
  auto* raw = static_cast<Pool*>(::operator new(n * sizeof(Pool),
                                                std::align_val_t(alignof(Pool)),
                                                std::nothrow));
  if (raw == nullptr) {
    return kheap_detail::unexpected<ConfigError>(ConfigError::AllocationFailed);
  }

  auto base = reinterpret_cast<std::uintptr_t>(memory.get());
  for (std::size_t i = 0; i < n; ++i) {
    ::new (static_cast<void*>(raw + i)) Pool(base, sorted[i].block_size, sorted[i].capacity);
    base += sorted[i].block_size * sorted[i].capacity;
  }
  std::unique_ptr<Pool[], PoolDeleter> pools(raw, PoolDeleter{n});

  return HeapArena(std::move(memory), total, std::move(pools), n, trace, cfg.trace_key);
}

} // namespace kheap::mem
