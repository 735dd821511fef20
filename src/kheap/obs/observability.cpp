/**
* @file observability.cpp
 * @brief printf-backed TracePort for bring-up and the statistics table renderer.
 */
#include "kheap/obs/observability.hpp"
#include <cstdio>

namespace kheap::obs {

    class StdoutTracePort : public TracePort {
    public:
        bool is_enabled() const noexcept override { return true; }
        void write(std::uint32_t word) noexcept override {
            // JSON-ish line, one per word
            std::printf(R"({"port":"heaptrace","word":"0x%08X"})" "\n", word);
            std::fflush(stdout);
        }
    };

    TracePort* make_stdout_trace_port() {
        static StdoutTracePort port; // process-wide singleton
        return &port;
    }

    std::string format_statistics(std::span<const kheap::mem::Statistics> stats) {
        std::string out;
        char line[96];
        std::snprintf(line, sizeof(line), "%-6s %12s %10s %10s %7s\n",
                      "pool", "block_size", "capacity", "remain", "used%");
        out += line;
        std::size_t index = 0;
        for (const auto& s : stats) {
            // remain is relaxed and may briefly exceed capacity under contention
            const std::size_t used = s.remain < s.capacity ? s.capacity - s.remain : 0;
            const double pct = s.capacity ? 100.0 * static_cast<double>(used) / static_cast<double>(s.capacity) : 0.0;
            std::snprintf(line, sizeof(line), "%-6zu %12zu %10zu %10zu %6.1f%%\n",
                          index++, s.block_size, s.capacity, s.remain, pct);
            out += line;
        }
        return out;
    }

} // namespace kheap::obs
