/**
 * @file main.cpp
 * @brief heap_inspect: build a heap from a layout file and exercise it once.
 *
 * Usage: heap_inspect [layout.toml]
 *
 * Without an argument the built-in pool table is used. The tool prints the
 * trace words emitted by a short allocate/grow/shrink/deallocate script and
 * the per-pool statistics while the final block is still held.
 */

#include <cstdio>
#include <cstring>
#include <iostream>

#include "kheap/config/config_loader.hpp"
#include "kheap/mem/heap_arena.hpp"
#include "kheap/obs/observability.hpp"
#include "kheap/version.hpp"

namespace {

int fail(const char* what, kheap::config::ConfigError e) {
  std::cerr << "heap_inspect: " << what << ": " << kheap::config::to_string(e) << "\n";
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  using kheap::mem::Layout;

  std::cout << "kheap " << kheap::version_string << " heap_inspect\n";

  kheap_detail::expected<kheap::config::HeapConfig, kheap::config::ConfigError> cfg =
    kheap::config::Loader::defaults();
  if (argc > 1) cfg = kheap::config::Loader::load_from_file(argv[1]);
  if (!cfg) return fail(argc > 1 ? argv[1] : "defaults", cfg.error());

  auto arena = kheap::mem::HeapArena::create(*cfg, kheap::obs::make_stdout_trace_port());
  if (!arena) return fail("arena", arena.error());
  auto& heap = arena->heap();

  std::cout << "pools=" << heap.pool_count() << " bytes=" << arena->size() << "\n";

  const Layout small = Layout::from_size_align_unchecked(20, 4);
  const Layout large = Layout::from_size_align_unchecked(100, 8);

  auto a = heap.allocate(small);
  if (!a) {
    std::cerr << "heap_inspect: allocate(" << small.size() << ") failed\n";
    return 1;
  }
  std::memcpy(a->ptr, "kheap-inspect-block", small.size());

  auto g = heap.grow(a->ptr, small, large);
  if (!g) {
    std::cerr << "heap_inspect: grow(" << small.size() << " -> " << large.size() << ") failed\n";
    heap.deallocate(a->ptr, small);
    return 1;
  }

  auto s = heap.shrink(g->ptr, large, small);
  if (!s) {
    std::cerr << "heap_inspect: shrink failed\n";
    heap.deallocate(g->ptr, large);
    return 1;
  }

  std::printf("contents preserved: %.*s\n", static_cast<int>(small.size() - 1),
              reinterpret_cast<const char*>(s->ptr));
  std::cout << kheap::obs::format_statistics(heap.statistics());

  heap.deallocate(s->ptr, small);
  return 0;
}
