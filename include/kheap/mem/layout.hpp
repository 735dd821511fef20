// =============================================================
// File: include/kheap/mem/layout.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <cstdint>

#include "kheap/compat/expected.hpp"

namespace kheap::mem {

/**
 * @file layout.hpp
 * @brief Request descriptor (size + alignment) and allocation result types.
 */

/// @brief The single recoverable allocation error. No distinction is made
/// between fragmentation and true exhaustion.
enum class AllocError : std::uint8_t {
  OutOfMemory = 1   ///< No pool from the best fit upward could serve the request
};

/// @brief Errors reported when building a Layout.
enum class LayoutError : std::uint8_t {
  AlignZero = 1,        ///< Alignment must not be zero
  AlignNotPowerOfTwo,   ///< Alignment must be a power of two
  SizeOverflow          ///< Size rounded up to the alignment overflows ptrdiff_t
};

/**
 * @brief Size and alignment of a requested allocation.
 *
 * The alignment is always a non-zero power of two when built through
 * from_size_align(). The heap never pads a block to honour it; pools whose
 * blocks are not aligned strongly enough are skipped instead.
 */
class Layout {
public:
  /// @brief Validating factory.
  static kheap_detail::expected<Layout, LayoutError>
  from_size_align(std::size_t size, std::size_t align) noexcept;

  /// @brief Build without validation. @p align must be a power of two.
  static constexpr Layout from_size_align_unchecked(std::size_t size, std::size_t align) noexcept {
    return Layout(size, align);
  }

  /// @brief Layout of a single object of type T.
  template <class T>
  static constexpr Layout of() noexcept { return Layout(sizeof(T), alignof(T)); }

  constexpr std::size_t size()  const noexcept { return size_; }
  constexpr std::size_t align() const noexcept { return align_; }

  /// @brief Non-null, well-aligned address that must never be dereferenced.
  /// Returned for zero-sized requests.
  std::byte* dangling() const noexcept { return reinterpret_cast<std::byte*>(align_); }

  friend constexpr bool operator==(const Layout&, const Layout&) noexcept = default;

private:
  constexpr Layout(std::size_t size, std::size_t align) noexcept : size_(size), align_(align) {}

  std::size_t size_;
  std::size_t align_;
};

/// @brief A successful allocation: start address and usable length.
/// The usable length is the block size of the serving pool and may exceed the
/// requested size.
struct Block {
  std::byte*  ptr{nullptr};
  std::size_t size{0};
};

using AllocResult = kheap_detail::expected<Block, AllocError>;

} // namespace kheap::mem
