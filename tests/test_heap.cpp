/**
 * @file test_heap.cpp
 * @brief Tests for the Heap dispatcher: binary search, allocation policy,
 *        grow/shrink, tracing and the std::pmr adapter.
 *
 * Validates:
 *  - size and address lookups on the ten-pool reference table
 *  - LIFO reuse and link placement inside freed blocks
 *  - zero-size requests never touch a pool
 *  - upgrade to a larger pool when the best fit is exhausted
 *  - grow/shrink copy lengths and failure safety
 *  - trace words emitted per operation
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory_resource>
#include <new>
#include <span>
#include <vector>

#include "kheap/config/config_loader.hpp"
#include "kheap/config/constants.hpp"
#include "kheap/mem/heap.hpp"
#include "kheap/mem/heap_arena.hpp"
#include "kheap/mem/heap_resource.hpp"
#include "recording_port.hpp"

using kheap::mem::AllocError;
using kheap::mem::Heap;
using kheap::mem::HeapArena;
using kheap::mem::HeapResource;
using kheap::mem::Layout;
using kheap::mem::Pool;
using kheap_test::RecordingPort;
namespace constants = kheap::config::constants;

namespace {

constexpr std::size_t POOL_COUNT = 10;

Layout layout(std::size_t size, std::size_t align = 1) {
  return Layout::from_size_align_unchecked(size, align);
}

std::uintptr_t addr(const void* p) { return reinterpret_cast<std::uintptr_t>(p); }

std::uintptr_t read_word(const std::byte* p) {
  std::uintptr_t w;
  std::memcpy(&w, p, sizeof(w));
  return w;
}

/// Block size of the pool a size/address resolves to, 0 when none does.
std::size_t resolved_block(const Heap& heap, std::size_t index) {
  return index < heap.pool_count() ? heap.pool(index).block_size() : 0;
}

/// Three pools over a real buffer: 16 x 4, 32 x 4, 64 x 2.
struct SmallHeap {
  alignas(64) std::array<std::byte, 16 * 4 + 32 * 4 + 64 * 2> mem{};
  std::array<Pool, 3> pools;
  Heap heap;

  explicit SmallHeap(kheap::obs::TracePort* port = nullptr)
    : pools{{Pool(addr(mem.data()), 16, 4),
             Pool(addr(mem.data() + 64), 32, 4),
             Pool(addr(mem.data() + 192), 64, 2)}},
      heap(pools, port) {}

  std::size_t remain(std::size_t i) const { return pools[i].statistics().remain; }
};

} // namespace

// --------------------------- Binary search ---------------------------------

/**
 * @test Heap_BinarySearch_ReferenceTable
 * @brief Ten pools laid out back to back from address 20 (final edge 32320).
 */
TEST(Heap, BinarySearch_ReferenceTable) {
  std::array<Pool, POOL_COUNT> pools{{
    Pool(20, 2, 100),    Pool(220, 5, 100),   Pool(720, 8, 100),
    Pool(1520, 12, 100), Pool(2720, 16, 100), Pool(4320, 23, 100),
    Pool(6620, 38, 100), Pool(10420, 56, 100), Pool(16020, 72, 100),
    Pool(23220, 91, 100),
  }};
  Heap heap(pools);

  auto by_size = [&](std::size_t s) { return resolved_block(heap, heap.find_by_size(s)); };
  auto by_addr = [&](std::uintptr_t a) {
    return resolved_block(heap, heap.find_by_address(reinterpret_cast<void*>(a)));
  };

  EXPECT_EQ(by_size(1), 2u);
  EXPECT_EQ(by_size(2), 2u);
  EXPECT_EQ(by_size(15), 16u);
  EXPECT_EQ(by_size(16), 16u);
  EXPECT_EQ(by_size(17), 23u);
  EXPECT_EQ(by_size(91), 91u);
  EXPECT_EQ(heap.find_by_size(92), POOL_COUNT);

  EXPECT_EQ(by_addr(0), 2u);
  EXPECT_EQ(by_addr(20), 2u);
  EXPECT_EQ(by_addr(219), 2u);
  EXPECT_EQ(by_addr(220), 5u);
  EXPECT_EQ(by_addr(719), 5u);
  EXPECT_EQ(by_addr(720), 8u);
  EXPECT_EQ(by_addr(721), 8u);
  EXPECT_EQ(by_addr(5000), 23u);
  EXPECT_EQ(by_addr(23220), 91u);
  EXPECT_EQ(by_addr(32319), 91u);
  EXPECT_EQ(heap.find_by_address(reinterpret_cast<void*>(32320)), POOL_COUNT);
  EXPECT_EQ(heap.find_by_address(reinterpret_cast<void*>(50000)), POOL_COUNT);
}

/**
 * @test Heap_BinarySearch_ZeroBasedTable
 * @brief Same table laid out from address 0 (final edge 32300).
 */
TEST(Heap, BinarySearch_ZeroBasedTable) {
  const std::size_t sizes[POOL_COUNT] = {2, 5, 8, 12, 16, 23, 38, 56, 72, 91};
  std::uintptr_t b[POOL_COUNT];
  std::uintptr_t next = 0;
  for (std::size_t i = 0; i < POOL_COUNT; ++i) { b[i] = next; next += sizes[i] * 100; }
  ASSERT_EQ(next, 32300u);

  std::array<Pool, POOL_COUNT> pools{{
    Pool(b[0], 2, 100),  Pool(b[1], 5, 100),  Pool(b[2], 8, 100),
    Pool(b[3], 12, 100), Pool(b[4], 16, 100), Pool(b[5], 23, 100),
    Pool(b[6], 38, 100), Pool(b[7], 56, 100), Pool(b[8], 72, 100),
    Pool(b[9], 91, 100),
  }};
  Heap heap(pools);
  auto by_addr = [&](std::uintptr_t a) {
    return resolved_block(heap, heap.find_by_address(reinterpret_cast<void*>(a)));
  };

  EXPECT_EQ(by_addr(0), 2u);
  EXPECT_EQ(by_addr(199), 2u);
  EXPECT_EQ(by_addr(220), 5u);
  EXPECT_EQ(by_addr(699), 5u);
  EXPECT_EQ(by_addr(719), 8u);
  EXPECT_EQ(by_addr(32299), 91u);
  EXPECT_EQ(heap.find_by_address(reinterpret_cast<void*>(32300)), POOL_COUNT);
}

// --------------------------- Allocation ------------------------------------

/**
 * @test Heap_Allocations_LinkWordsAndLifo
 * @brief 32-byte requests land in the 38-byte pool; freed blocks carry the
 *        previous head in their first word and are reused last-in first-out.
 */
TEST(Heap, Allocations_LinkWordsAndLifo) {
  alignas(16) std::array<std::byte, 3230> m{};
  const auto o = addr(m.data());
  std::array<Pool, POOL_COUNT> pools{{
    Pool(o + 0, 2, 10),     Pool(o + 20, 5, 10),    Pool(o + 70, 8, 10),
    Pool(o + 150, 12, 10),  Pool(o + 270, 16, 10),  Pool(o + 430, 23, 10),
    Pool(o + 660, 38, 10),  Pool(o + 1040, 56, 10), Pool(o + 1600, 72, 10),
    Pool(o + 2320, 91, 10),
  }};
  Heap heap(pools);
  const Layout l = layout(32);

  auto allocate_and_set = [&](std::uint8_t value) {
    auto block = heap.allocate(l);
    ASSERT_TRUE(block);
    EXPECT_EQ(block->size, 38u);
    *block->ptr = std::byte{value};
  };

  allocate_and_set(111);
  EXPECT_EQ(m[660], std::byte{111});
  allocate_and_set(222);
  EXPECT_EQ(m[698], std::byte{222});
  allocate_and_set(123);
  EXPECT_EQ(m[736], std::byte{123});

  heap.deallocate(m.data() + 660, l);
  EXPECT_EQ(read_word(m.data() + 660), 0u);
  heap.deallocate(m.data() + 736, l);
  EXPECT_EQ(read_word(m.data() + 736), o + 660);

  allocate_and_set(202);
  EXPECT_EQ(m[736], std::byte{202});

  heap.deallocate(m.data() + 698, l);
  EXPECT_EQ(read_word(m.data() + 698), o + 660);
  heap.deallocate(m.data() + 736, l);
  EXPECT_EQ(read_word(m.data() + 736), o + 698);
}

TEST(Heap, Allocate_DistinctBlocksWithinPool) {
  SmallHeap h;
  std::vector<std::byte*> got;
  for (int i = 0; i < 4; ++i) {
    auto b = h.heap.allocate(layout(10));
    ASSERT_TRUE(b);
    EXPECT_EQ(b->size, 16u);
    EXPECT_TRUE(h.pools[0].contains(b->ptr));
    got.push_back(b->ptr);
  }
  std::sort(got.begin(), got.end());
  for (std::size_t i = 1; i < got.size(); ++i) {
    EXPECT_GE(got[i] - got[i - 1], 16) << "blocks overlap";
  }
}

TEST(Heap, ZeroSize_NeverTouchesPools) {
  SmallHeap h;
  auto b = h.heap.allocate(layout(0, 8));
  ASSERT_TRUE(b);
  EXPECT_NE(b->ptr, nullptr);
  EXPECT_EQ(b->size, 0u);
  EXPECT_EQ(addr(b->ptr), 8u);
  for (std::size_t i = 0; i < h.pools.size(); ++i) EXPECT_EQ(h.remain(i), h.pools[i].capacity());

  h.heap.deallocate(b->ptr, layout(0, 8));
  for (std::size_t i = 0; i < h.pools.size(); ++i) EXPECT_EQ(h.remain(i), h.pools[i].capacity());
}

TEST(Heap, UpgradeOnExhaustion) {
  SmallHeap h;
  for (int i = 0; i < 4; ++i) ASSERT_TRUE(h.heap.allocate(layout(16)));
  EXPECT_EQ(h.remain(0), 0u);

  auto b = h.heap.allocate(layout(16));
  ASSERT_TRUE(b);
  EXPECT_EQ(b->size, 32u);
  EXPECT_TRUE(h.pools[1].contains(b->ptr));
  EXPECT_EQ(h.remain(1), 3u);
}

TEST(Heap, AllExhausted_ReportsOutOfMemory) {
  SmallHeap h;
  int served = 0;
  while (h.heap.allocate(layout(1))) ++served;
  EXPECT_EQ(served, 10);

  auto b = h.heap.allocate(layout(1));
  ASSERT_FALSE(b);
  EXPECT_EQ(b.error(), AllocError::OutOfMemory);
}

TEST(Heap, TooLarge_ReportsOutOfMemory) {
  SmallHeap h;
  EXPECT_EQ(h.heap.find_by_size(65), h.heap.pool_count());
  EXPECT_FALSE(h.heap.allocate(layout(65)));
}

TEST(Heap, Exhausted_FreeOne_NextAllocationReusesIt) {
  SmallHeap h;
  std::vector<std::byte*> held;
  for (int i = 0; i < 2; ++i) held.push_back(h.heap.allocate(layout(64))->ptr);
  ASSERT_FALSE(h.heap.allocate(layout(64)));

  h.heap.deallocate(held[0], layout(64));
  auto b = h.heap.allocate(layout(64));
  ASSERT_TRUE(b);
  EXPECT_EQ(b->ptr, held[0]);
}

TEST(Heap, Alignment_SkipsUnderAlignedPools) {
  SmallHeap h;
  ASSERT_EQ(h.pools[0].alignment(), 16u);
  ASSERT_EQ(h.pools[1].alignment(), 32u);

  auto b = h.heap.allocate(layout(8, 32));
  ASSERT_TRUE(b);
  EXPECT_EQ(b->size, 32u);
  EXPECT_EQ(addr(b->ptr) % 32, 0u);
  EXPECT_EQ(h.remain(0), 4u);

  EXPECT_FALSE(h.heap.allocate(layout(8, 128)));
}

TEST(Layout, FromSizeAlign_Validates) {
  using kheap::mem::LayoutError;
  EXPECT_EQ(Layout::from_size_align(8, 0).error(), LayoutError::AlignZero);
  EXPECT_EQ(Layout::from_size_align(8, 24).error(), LayoutError::AlignNotPowerOfTwo);
  EXPECT_EQ(Layout::from_size_align(SIZE_MAX - 2, 8).error(), LayoutError::SizeOverflow);

  const auto l = Layout::from_size_align(40, 8);
  ASSERT_TRUE(l);
  EXPECT_EQ(*l, layout(40, 8));
  EXPECT_EQ(Layout::of<std::uint64_t>(), layout(sizeof(std::uint64_t), alignof(std::uint64_t)));
  EXPECT_EQ(addr(layout(0, 16).dangling()), 16u);
}

TEST(Heap, AllocateTyped_HonoursNaturalAlignment) {
  SmallHeap h;
  auto b = h.heap.allocate(Layout::of<std::uint64_t>());
  ASSERT_TRUE(b);
  EXPECT_EQ(b->size, 16u);
  EXPECT_EQ(addr(b->ptr) % alignof(std::uint64_t), 0u);
}

TEST(Heap, AllocateZeroed_ClearsWholeUsableRegion) {
  SmallHeap h;
  std::memset(h.mem.data(), 0xAB, h.mem.size());
  auto b = h.heap.allocate_zeroed(layout(20));
  ASSERT_TRUE(b);
  ASSERT_EQ(b->size, 32u);
  for (std::size_t i = 0; i < b->size; ++i) EXPECT_EQ(b->ptr[i], std::byte{0}) << i;
}

// --------------------------- Grow / Shrink ---------------------------------

TEST(Heap, Grow_CopiesOldContentAndFreesOld) {
  SmallHeap h;
  auto old_block = h.heap.allocate(layout(12));
  ASSERT_TRUE(old_block);
  for (std::size_t i = 0; i < 12; ++i) old_block->ptr[i] = std::byte(i + 1);

  auto grown = h.heap.grow(old_block->ptr, layout(12), layout(40));
  ASSERT_TRUE(grown);
  EXPECT_EQ(grown->size, 64u);
  EXPECT_TRUE(h.pools[2].contains(grown->ptr));
  for (std::size_t i = 0; i < 12; ++i) EXPECT_EQ(grown->ptr[i], std::byte(i + 1));

  // old block went back to its pool
  EXPECT_EQ(h.remain(0), 4u);
  EXPECT_EQ(h.heap.allocate(layout(12))->ptr, old_block->ptr);
}

TEST(Heap, Grow_FailureLeavesOldBlockIntact) {
  SmallHeap h;
  ASSERT_TRUE(h.heap.allocate(layout(64)));
  ASSERT_TRUE(h.heap.allocate(layout(64)));

  auto old_block = h.heap.allocate(layout(30));
  ASSERT_TRUE(old_block);
  std::memset(old_block->ptr, 0x5A, 30);
  const auto remain_before = h.remain(1);

  auto grown = h.heap.grow(old_block->ptr, layout(30), layout(60));
  ASSERT_FALSE(grown);
  EXPECT_EQ(grown.error(), AllocError::OutOfMemory);
  EXPECT_EQ(h.remain(1), remain_before);
  for (std::size_t i = 0; i < 30; ++i) EXPECT_EQ(old_block->ptr[i], std::byte{0x5A});
}

TEST(Heap, GrowZeroed_TailIsZero) {
  SmallHeap h;
  std::memset(h.mem.data(), 0xEE, h.mem.size());
  auto old_block = h.heap.allocate(layout(16));
  ASSERT_TRUE(old_block);
  std::memset(old_block->ptr, 0x11, 16);

  auto grown = h.heap.grow_zeroed(old_block->ptr, layout(16), layout(48));
  ASSERT_TRUE(grown);
  for (std::size_t i = 0; i < 16; ++i)  EXPECT_EQ(grown->ptr[i], std::byte{0x11});
  for (std::size_t i = 16; i < grown->size; ++i) EXPECT_EQ(grown->ptr[i], std::byte{0}) << i;
}

TEST(Heap, Shrink_CopiesNewSize) {
  SmallHeap h;
  auto old_block = h.heap.allocate(layout(60));
  ASSERT_TRUE(old_block);
  for (std::size_t i = 0; i < 60; ++i) old_block->ptr[i] = std::byte(i);

  auto shrunk = h.heap.shrink(old_block->ptr, layout(60), layout(10));
  ASSERT_TRUE(shrunk);
  EXPECT_EQ(shrunk->size, 16u);
  EXPECT_NE(shrunk->ptr, old_block->ptr);
  for (std::size_t i = 0; i < 10; ++i) EXPECT_EQ(shrunk->ptr[i], std::byte(i));
  EXPECT_EQ(h.remain(2), 2u);
}

TEST(Heap, Statistics_OnePerPool) {
  SmallHeap h;
  ASSERT_TRUE(h.heap.allocate(layout(30)));
  const auto stats = h.heap.statistics();
  ASSERT_EQ(stats.size(), 3u);
  EXPECT_EQ(stats[0].block_size, 16u);
  EXPECT_EQ(stats[1].block_size, 32u);
  EXPECT_EQ(stats[1].capacity, 4u);
  EXPECT_EQ(stats[1].remain, 3u);
  EXPECT_EQ(stats[2].remain, 2u);

  // pools() is the same view the heap dispatches over
  const auto pools = h.heap.pools();
  ASSERT_EQ(pools.size(), h.heap.pool_count());
  for (std::size_t i = 0; i < pools.size(); ++i) {
    EXPECT_EQ(&pools[i], &h.pools[i]);
    EXPECT_EQ(pools[i].statistics().remain, stats[i].remain);
  }
}

TEST(HeapTrace, TracerCarriesPortAndKey) {
  RecordingPort port;
  Heap traced(std::span<Pool>{}, &port, 0x1234U);
  EXPECT_EQ(traced.tracer().port(), &port);
  EXPECT_EQ(traced.tracer().key(), 0x1234U);
  EXPECT_TRUE(traced.tracer().enabled());

  Heap silent(std::span<Pool>{});
  EXPECT_FALSE(silent.tracer().enabled());
  EXPECT_EQ(silent.tracer().key(), constants::TRACE_KEY_DEFAULT);
}

// --------------------------- Trace -----------------------------------------

TEST(HeapTrace, Allocate_EmitsTwoScrambledWords) {
  RecordingPort port;
  SmallHeap h(&port);
  const std::uint32_t K = constants::TRACE_KEY_DEFAULT;

  ASSERT_TRUE(h.heap.allocate(layout(20)));
  ASSERT_EQ(port.words.size(), 2u);
  EXPECT_EQ(port.words[0], 0xA1000000U ^ K);
  EXPECT_EQ(port.words[1], 0xA2000014U ^ K);
}

TEST(HeapTrace, DeallocateGrowShrink_Words) {
  RecordingPort port;
  SmallHeap h(&port);
  const std::uint32_t K = constants::TRACE_KEY_DEFAULT;

  auto b = h.heap.allocate(layout(20));
  ASSERT_TRUE(b);
  port.words.clear();

  auto g = h.heap.grow(b->ptr, layout(20), layout(40));
  ASSERT_TRUE(g);
  ASSERT_EQ(port.words.size(), 3u);
  EXPECT_EQ(port.words[0], 0xB1000000U ^ K);
  EXPECT_EQ(port.words[1], 0xB2140000U ^ K);
  EXPECT_EQ(port.words[2], 0xB3000028U ^ K);
  port.words.clear();

  auto s = h.heap.shrink(g->ptr, layout(40), layout(20));
  ASSERT_TRUE(s);
  ASSERT_EQ(port.words.size(), 3u);
  EXPECT_EQ(port.words[0], 0xC1000000U ^ K);
  EXPECT_EQ(port.words[1], 0xC2280000U ^ K);
  EXPECT_EQ(port.words[2], 0xC3000014U ^ K);
  port.words.clear();

  h.heap.deallocate(s->ptr, layout(20));
  ASSERT_EQ(port.words.size(), 2u);
  EXPECT_EQ(port.words[0], 0xD1000000U ^ K);
  EXPECT_EQ(port.words[1], 0xD2000014U ^ K);
}

TEST(HeapTrace, DisabledPortOrZeroSize_EmitsNothing) {
  RecordingPort port;
  port.enabled = false;
  SmallHeap h(&port);
  auto b = h.heap.allocate(layout(20));
  ASSERT_TRUE(b);
  h.heap.deallocate(b->ptr, layout(20));
  EXPECT_TRUE(port.words.empty());

  port.enabled = true;
  auto z = h.heap.allocate(layout(0));
  ASSERT_TRUE(z);
  h.heap.deallocate(z->ptr, layout(0));
  EXPECT_TRUE(port.words.empty());
}

TEST(HeapTrace, TracingDoesNotChangeOutcome) {
  RecordingPort port;
  SmallHeap traced(&port);
  SmallHeap plain;
  for (std::size_t size : {1u, 16u, 17u, 33u, 64u, 64u, 64u}) {
    auto a = traced.heap.allocate(layout(size));
    auto b = plain.heap.allocate(layout(size));
    ASSERT_EQ(a.has_value(), b.has_value()) << size;
    if (a) {
      EXPECT_EQ(a->size, b->size);
      EXPECT_EQ(a->ptr - traced.mem.data(), b->ptr - plain.mem.data());
    }
  }
}

// --------------------------- std::pmr adapter ------------------------------

TEST(HeapResource, BacksPmrContainers) {
  auto arena = HeapArena::create(kheap::config::Loader::defaults());
  ASSERT_TRUE(arena);
  HeapResource res(arena->heap());

  {
    std::pmr::vector<int> v(&res);
    for (int i = 0; i < 100; ++i) v.push_back(i);
    for (int i = 0; i < 100; ++i) EXPECT_EQ(v[i], i);
    const auto* first = reinterpret_cast<const std::byte*>(v.data());
    EXPECT_GE(first, arena->base());
    EXPECT_LT(first, arena->base() + arena->size());
  }

  // everything returned once the container is gone
  for (const auto& s : arena->heap().statistics()) EXPECT_EQ(s.remain, s.capacity);
}

TEST(HeapResource, FailureBecomesBadAlloc) {
  auto arena = HeapArena::create(kheap::config::Loader::defaults());
  ASSERT_TRUE(arena);
  HeapResource res(arena->heap());

  EXPECT_THROW(res.allocate(4096, 8), std::bad_alloc);
  EXPECT_THROW(res.allocate(16, 3), std::bad_alloc);

  HeapResource same(arena->heap());
  EXPECT_EQ(&same.heap(), &arena->heap());
  EXPECT_TRUE(res.is_equal(same));
  EXPECT_FALSE(res.is_equal(*std::pmr::new_delete_resource()));
}
