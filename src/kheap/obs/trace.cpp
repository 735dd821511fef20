/**
 * @file trace.cpp
 * @brief Out-of-line packing for HeapTracer.
 */
#include "kheap/obs/trace.hpp"

namespace kheap::obs {

using namespace kheap::config::constants;

void HeapTracer::emit_pair(std::uint32_t op1, std::uint32_t op2, std::uint32_t size) const noexcept {
    port_->write((op1 << TRACE_OP_SHIFT | size >> 24) ^ key_);
    port_->write((op2 << TRACE_OP_SHIFT | (size & 0xFF)) ^ key_);
}

void HeapTracer::emit_triple(std::uint32_t op1, std::uint32_t op2, std::uint32_t op3,
                             std::uint32_t old_size, std::uint32_t new_size) const noexcept {
    port_->write((op1 << TRACE_OP_SHIFT | old_size >> 24) ^ key_);
    port_->write((op2 << TRACE_OP_SHIFT | (old_size & 0xFF) << 16 | new_size >> 16) ^ key_);
    port_->write((op3 << TRACE_OP_SHIFT | (new_size & 0xFFFF)) ^ key_);
}

void HeapTracer::trace_allocate(std::size_t size) const noexcept {
    emit_pair(TRACE_OP_ALLOC_1, TRACE_OP_ALLOC_2, static_cast<std::uint32_t>(size));
}

void HeapTracer::trace_deallocate(std::size_t size) const noexcept {
    emit_pair(TRACE_OP_DEALLOC_1, TRACE_OP_DEALLOC_2, static_cast<std::uint32_t>(size));
}

void HeapTracer::trace_grow(std::size_t old_size, std::size_t new_size) const noexcept {
    emit_triple(TRACE_OP_GROW_1, TRACE_OP_GROW_2, TRACE_OP_GROW_3,
                static_cast<std::uint32_t>(old_size), static_cast<std::uint32_t>(new_size));
}

void HeapTracer::trace_shrink(std::size_t old_size, std::size_t new_size) const noexcept {
    emit_triple(TRACE_OP_SHRINK_1, TRACE_OP_SHRINK_2, TRACE_OP_SHRINK_3,
                static_cast<std::uint32_t>(old_size), static_cast<std::uint32_t>(new_size));
}

} // namespace kheap::obs
