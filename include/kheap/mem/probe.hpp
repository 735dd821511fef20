/**
 * @file probe.hpp
 * @brief Fits predicates and the lower-bound search shared by both lookup axes.
 *
 * A pool array sorted ascending by block size is, by configuration, also
 * sorted ascending by address. Both probes below are therefore monotonic over
 * the same array (false…false, true…true) and one binary search serves both.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "kheap/mem/pool.hpp"

namespace kheap::mem {

/// @brief Holds iff the requested size fits into a pool's blocks.
struct SizeProbe {
  std::size_t size;
  bool fits(const Pool& pool) const noexcept { return size <= pool.block_size(); }
};

/// @brief Holds iff the address lies below a pool's edge.
struct AddressProbe {
  std::uintptr_t address;
  bool fits(const Pool& pool) const noexcept { return address < pool.edge(); }
};

/**
 * @brief Index of the first pool satisfying @p probe, or pools.size() if none.
 * @tparam Probe SizeProbe or AddressProbe (anything with `bool fits(const Pool&)`).
 */
template <class Probe>
std::size_t lower_bound_pool(std::span<const Pool> pools, const Probe& probe) noexcept {
  std::size_t left = 0;
  std::size_t right = pools.size();
  while (right > left) {
    const std::size_t middle = left + ((right - left) >> 1);
    if (probe.fits(pools[middle])) {
      right = middle;
    } else {
      left = middle + 1;
    }
  }
  return left;
}

} // namespace kheap::mem
