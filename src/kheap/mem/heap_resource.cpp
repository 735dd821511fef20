// =============================================================
// File: src/kheap/mem/heap_resource.cpp
// =============================================================
#include "kheap/mem/heap_resource.hpp"

#include <new>

namespace kheap::mem {

void* HeapResource::do_allocate(std::size_t bytes, std::size_t alignment) {
  const auto layout = Layout::from_size_align(bytes, alignment);
  if (!layout) {
    throw std::bad_alloc();
  }
  auto block = heap_->allocate(*layout);
  if (!block) {
    throw std::bad_alloc();
  }
  return block->ptr;
}

void HeapResource::do_deallocate(void* p, std::size_t bytes, std::size_t alignment) {
  // Sizes and alignments reaching here were accepted by do_allocate.
  heap_->deallocate(static_cast<std::byte*>(p),
                    Layout::from_size_align_unchecked(bytes, alignment));
}

bool HeapResource::do_is_equal(const std::pmr::memory_resource& other) const noexcept {
  const auto* o = dynamic_cast<const HeapResource*>(&other);
  return o != nullptr && o->heap_ == heap_;
}

} // namespace kheap::mem
