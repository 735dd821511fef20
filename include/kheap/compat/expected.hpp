/**
* @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * Users in kheap:
 * - mem::AllocResult from Heap::allocate/grow/shrink (AllocError)
 * - Layout::from_size_align (LayoutError)
 * - HeapArena::create, config::validate, Loader::from_string/load_from_file (ConfigError)
 * - obs::TraceDecoder::feed (TraceDecodeError)
 * Always spell unexpected<E>(...) with an explicit E; the alias has no deduction guide.
 *
 * - In C++23 and later: uses <expected> from the standard library.
 * - In C++20 or earlier: falls back to <tl/expected.hpp>, the header-only
 *   backport by TartanLlama (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace kheap_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace kheap_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
