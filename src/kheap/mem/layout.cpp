#include "kheap/mem/layout.hpp"

#include <cstddef>
#include <limits>

namespace kheap::mem {

kheap_detail::expected<Layout, LayoutError>
Layout::from_size_align(std::size_t size, std::size_t align) noexcept {
  if (align == 0) {
    return kheap_detail::unexpected<LayoutError>(LayoutError::AlignZero);
  }
  if ((align & (align - 1)) != 0) {
    return kheap_detail::unexpected<LayoutError>(LayoutError::AlignNotPowerOfTwo);
  }
  constexpr auto max_size = static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max());
  if (size > max_size - (align - 1)) {
    return kheap_detail::unexpected<LayoutError>(LayoutError::SizeOverflow);
  }
  return Layout(size, align);
}

} // namespace kheap::mem
