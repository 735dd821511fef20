// =============================================================
// File: include/kheap/mem/heap_resource.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <memory_resource>

#include "kheap/mem/heap.hpp"

namespace kheap::mem {

/**
 * @file heap_resource.hpp
 * @brief std::pmr adapter so runtime containers can draw from a Heap.
 *
 * This is the allocation hook of the enclosing runtime: a failed allocation
 * becomes std::bad_alloc, the runtime's out-of-memory condition. The heap
 * itself never throws.
 */
class HeapResource final : public std::pmr::memory_resource {
public:
  explicit HeapResource(Heap& heap) noexcept : heap_(&heap) {}

  Heap& heap() const noexcept { return *heap_; }

private:
  void* do_allocate(std::size_t bytes, std::size_t alignment) override;
  void  do_deallocate(void* p, std::size_t bytes, std::size_t alignment) override;
  bool  do_is_equal(const std::pmr::memory_resource& other) const noexcept override;

  Heap* heap_;
};

} // namespace kheap::mem
