#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the heap, its trace stream and its layout.
 * @details These values eliminate magic numbers from the codebase. Override the
 *          layout and the trace key via the Config Loader (TOML).
 */

#include <cstddef>
#include <cstdint>

namespace kheap::config::constants {

// =====================
// Trace stream opcodes (top byte of every 32-bit trace word)
// =====================
inline constexpr std::uint32_t TRACE_OP_ALLOC_1   = 0xA1; ///< allocate, size bits 24..31
inline constexpr std::uint32_t TRACE_OP_ALLOC_2   = 0xA2; ///< allocate, size bits 0..7
inline constexpr std::uint32_t TRACE_OP_DEALLOC_1 = 0xD1; ///< deallocate, size bits 24..31
inline constexpr std::uint32_t TRACE_OP_DEALLOC_2 = 0xD2; ///< deallocate, size bits 0..7
inline constexpr std::uint32_t TRACE_OP_GROW_1    = 0xB1; ///< grow, old size bits 24..31
inline constexpr std::uint32_t TRACE_OP_GROW_2    = 0xB2; ///< grow, old size bits 0..7 + new size bits 16..31
inline constexpr std::uint32_t TRACE_OP_GROW_3    = 0xB3; ///< grow, new size bits 0..15
inline constexpr std::uint32_t TRACE_OP_SHRINK_1  = 0xC1; ///< shrink, same shape as grow
inline constexpr std::uint32_t TRACE_OP_SHRINK_2  = 0xC2;
inline constexpr std::uint32_t TRACE_OP_SHRINK_3  = 0xC3;

/// Bit position of the opcode inside a trace word.
inline constexpr unsigned TRACE_OP_SHIFT = 24;

/// Scrambling key XORed into every trace word before it reaches the port.
inline constexpr std::uint32_t TRACE_KEY_DEFAULT = 0x0E7C5F1DU;

// =====================
// Layout defaults
// =====================
/// Alignment of the backing allocation of a HeapArena (one cache line).
inline constexpr std::size_t ARENA_ALIGN = 64;

/// Smallest block a pool may hold: the free-list link lives inside the block.
inline constexpr std::size_t MIN_BLOCK_SIZE = sizeof(void*);

/// Largest pool: block indices share the 64-bit free-list head with a
/// 32-bit generation, and index 0xFFFFFFFF marks an empty list.
inline constexpr std::size_t MAX_POOL_CAPACITY = 0xFFFFFFFEU;

// =====================
// Default pool table (block size in bytes, capacity in blocks)
// Heap size 0 means "sum of the pools".
// =====================
inline constexpr std::size_t DEFAULT_HEAP_SIZE = 0;
inline constexpr std::size_t DEFAULT_POOL_COUNT = 7;
inline constexpr std::size_t DEFAULT_POOL_BLOCKS[DEFAULT_POOL_COUNT]     = {16, 32, 64, 128, 256, 512, 1024};
inline constexpr std::size_t DEFAULT_POOL_CAPACITIES[DEFAULT_POOL_COUNT] = {128, 128, 64, 32, 16, 8, 4};

} // namespace kheap::config::constants
