// =============================================================
// File: src/kheap/mem/heap.cpp
// =============================================================
#include "kheap/mem/heap.hpp"
#include "kheap/mem/probe.hpp"

#include <cassert>
#include <cstring>

namespace kheap::mem {

std::size_t Heap::find_by_size(std::size_t size) const noexcept {
  return lower_bound_pool(pools_, SizeProbe{size});
}

std::size_t Heap::find_by_address(const void* ptr) const noexcept {
  return lower_bound_pool(pools_, AddressProbe{reinterpret_cast<std::uintptr_t>(ptr)});
}

AllocResult Heap::allocate(Layout layout) noexcept {
  if (layout.size() == 0) {
    return Block{layout.dangling(), 0};
  }
  tracer_.allocate(layout.size());
  return allocate_untraced(layout);
}

AllocResult Heap::allocate_zeroed(Layout layout) noexcept {
  auto block = allocate(layout);
  if (block && block->size != 0) {
    std::memset(block->ptr, 0, block->size);
  }
  return block;
}

void Heap::deallocate(std::byte* ptr, Layout layout) noexcept {
  if (layout.size() == 0) {
    return;
  }
  tracer_.deallocate(layout.size());
  deallocate_untraced(ptr, layout);
}

AllocResult Heap::grow(std::byte* ptr, Layout old_layout, Layout new_layout) noexcept {
  tracer_.grow(old_layout.size(), new_layout.size());
  return relocate(ptr, old_layout, new_layout, old_layout.size(), false);
}

AllocResult Heap::grow_zeroed(std::byte* ptr, Layout old_layout, Layout new_layout) noexcept {
  tracer_.grow(old_layout.size(), new_layout.size());
  return relocate(ptr, old_layout, new_layout, old_layout.size(), true);
}

AllocResult Heap::shrink(std::byte* ptr, Layout old_layout, Layout new_layout) noexcept {
  tracer_.shrink(old_layout.size(), new_layout.size());
  return relocate(ptr, old_layout, new_layout, new_layout.size(), false);
}

std::vector<Statistics> Heap::statistics() const {
  std::vector<Statistics> out;
  out.reserve(pools_.size());
  for (const auto& pool : pools_) {
    out.push_back(pool.statistics());
  }
  return out;
}

AllocResult Heap::allocate_untraced(Layout layout) noexcept {
  if (layout.size() == 0) {
    return Block{layout.dangling(), 0};
  }
  for (std::size_t i = find_by_size(layout.size()); i < pools_.size(); ++i) {
    Pool& pool = pools_[i];
    if (pool.alignment() < layout.align()) {
      continue;
    }
    if (std::byte* ptr = pool.allocate()) {
      return Block{ptr, pool.block_size()};
    }
  }
  return kheap_detail::unexpected<AllocError>(AllocError::OutOfMemory);
}

void Heap::deallocate_untraced(std::byte* ptr, Layout layout) noexcept {
  if (layout.size() == 0) {
    return;
  }
  const std::size_t index = find_by_address(ptr);
  assert(index < pools_.size() && "Heap::deallocate: pointer above the last pool");
  pools_[index].deallocate(ptr);
}

AllocResult Heap::relocate(std::byte* ptr, Layout old_layout, Layout new_layout,
                           std::size_t copy_len, bool zeroed) noexcept {
  auto block = allocate_untraced(new_layout);
  if (!block) {
    return block; // old block untouched
  }
  if (zeroed && block->size != 0) {
    std::memset(block->ptr, 0, block->size);
  }
  if (copy_len != 0) {
    std::memcpy(block->ptr, ptr, copy_len);
  }
  deallocate_untraced(ptr, old_layout);
  return block;
}

} // namespace kheap::mem
