// =============================================================
// File: src/kheap/mem/pool.cpp
// =============================================================
#include "kheap/mem/pool.hpp"
#include "kheap/config/constants.hpp"

#include <cassert>
#include <cstring>
#include <limits>

namespace kheap::mem {

namespace {

// The free-list link occupies the first word of a free block. Blocks carry no
// alignment guarantee beyond their pool's, so the word is copied bytewise.
inline std::byte* load_link(const std::byte* block) noexcept {
  std::byte* next;
  std::memcpy(&next, block, sizeof(next));
  return next;
}

inline void store_link(std::byte* block, std::byte* next) noexcept {
  std::memcpy(block, &next, sizeof(next));
}

inline std::uint64_t pack_head(std::uint32_t index, std::uint32_t generation) noexcept {
  return static_cast<std::uint64_t>(generation) << 32 | index;
}

inline std::uint32_t head_index(std::uint64_t head) noexcept {
  return static_cast<std::uint32_t>(head);
}

inline std::uint32_t head_generation(std::uint64_t head) noexcept {
  return static_cast<std::uint32_t>(head >> 32);
}

} // namespace

Pool::Pool(std::uintptr_t base, std::size_t block_size, std::size_t capacity) noexcept
  : block_size_(block_size),
    capacity_(capacity),
    base_(base),
    edge_(base + block_size * capacity),
    uninit_(base),
    remain_(capacity)
{
  assert(capacity <= config::constants::MAX_POOL_CAPACITY && "Pool: capacity exceeds the free-list index range");
}

std::byte* Pool::allocate() noexcept {
  if (std::byte* ptr = alloc_free()) {
    return ptr;
  }
  return alloc_uninit();
}

void Pool::deallocate(std::byte* ptr) noexcept {
  const std::uint32_t index = index_of(ptr);
  std::uint64_t curr = free_.load(std::memory_order_acquire);
  do {
    store_link(ptr, block_at(head_index(curr)));
  } while (!free_.compare_exchange_weak(curr, pack_head(index, head_generation(curr) + 1),
                                        std::memory_order_acq_rel,
                                        std::memory_order_acquire));
  remain_.fetch_add(1, std::memory_order_relaxed);
}

Statistics Pool::statistics() const noexcept {
  return Statistics{block_size_, capacity_, remain_.load(std::memory_order_relaxed)};
}

std::size_t Pool::alignment() const noexcept {
  const std::uintptr_t bits = base_ | static_cast<std::uintptr_t>(block_size_);
  if (bits == 0) {
    return static_cast<std::size_t>(std::numeric_limits<std::uintptr_t>::max() / 2 + 1);
  }
  return static_cast<std::size_t>(bits & (~bits + 1));
}

std::byte* Pool::alloc_free() noexcept {
  std::uint64_t curr = free_.load(std::memory_order_acquire);
  while (head_index(curr) != kNoBlock) {
    std::byte* block = block_at(head_index(curr));
    // The link may already be overwritten by another owner; the generation
    // check in the CAS rejects whatever was read in that case.
    const std::uint32_t next = index_of(load_link(block));
    if (free_.compare_exchange_weak(curr, pack_head(next, head_generation(curr) + 1),
                                    std::memory_order_acq_rel,
                                    std::memory_order_acquire)) {
      remain_.fetch_sub(1, std::memory_order_relaxed);
      return block;
    }
  }
  return nullptr;
}

std::byte* Pool::block_at(std::uint32_t index) const noexcept {
  if (index == kNoBlock) {
    return nullptr;
  }
  return reinterpret_cast<std::byte*>(base_ + static_cast<std::uintptr_t>(index) * block_size_);
}

std::uint32_t Pool::index_of(const std::byte* ptr) const noexcept {
  if (ptr == nullptr) {
    return kNoBlock;
  }
  return static_cast<std::uint32_t>((reinterpret_cast<std::uintptr_t>(ptr) - base_) / block_size_);
}

std::byte* Pool::alloc_uninit() noexcept {
  std::uintptr_t curr = uninit_.load(std::memory_order_relaxed);
  while (curr != edge_) {
    if (uninit_.compare_exchange_weak(curr, curr + block_size_,
                                      std::memory_order_relaxed,
                                      std::memory_order_relaxed)) {
      remain_.fetch_sub(1, std::memory_order_relaxed);
      return reinterpret_cast<std::byte*>(curr);
    }
  }
  return nullptr;
}

} // namespace kheap::mem
