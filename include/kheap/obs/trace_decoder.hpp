#pragma once
/**
 * @file trace_decoder.hpp
 * @brief Host-side reassembly of heap trace words into events.
 */

#include <cstdint>
#include <optional>

#include "kheap/compat/expected.hpp"
#include "kheap/config/constants.hpp"

namespace kheap::obs {

/// @brief Kind of traced heap operation.
enum class TraceOp : std::uint8_t { Allocate, Deallocate, Grow, Shrink };

/// @brief Errors reported while decoding a word stream.
enum class TraceDecodeError : std::uint8_t {
    UnknownOpcode = 1,  ///< Top byte is not a heap trace opcode
    OutOfSequence       ///< Valid opcode, but not the one expected next
};

/// Bits of a size that survive the two-word encoding (bits 24..31 and 0..7).
inline constexpr std::uint32_t TRACE_PARTIAL_SIZE_MASK = 0xFF0000FFU;

/**
 * @struct TraceEvent
 * @brief One decoded operation.
 *
 * `size` holds only the bits covered by TRACE_PARTIAL_SIZE_MASK: the request
 * size for allocate/deallocate, the old size for grow/shrink. `new_size` is
 * carried in full by grow/shrink and is zero otherwise.
 */
struct TraceEvent {
    TraceOp       op{TraceOp::Allocate};
    std::uint32_t size{0};
    std::uint32_t new_size{0};

    friend bool operator==(const TraceEvent&, const TraceEvent&) = default;
};

/**
 * @class TraceDecoder
 * @brief Feed scrambled words one at a time; a complete event pops out after
 *        the last word of each record.
 *
 * On any error the partial record is dropped and decoding resynchronises on
 * the next first-word opcode.
 */
class TraceDecoder {
public:
    explicit TraceDecoder(std::uint32_t key = kheap::config::constants::TRACE_KEY_DEFAULT) noexcept
        : key_(key) {}

    /// @return an event when @p word completes a record, nullopt when more words are needed.
    kheap_detail::expected<std::optional<TraceEvent>, TraceDecodeError>
    feed(std::uint32_t word) noexcept;

    /// True while a record has been started but not finished.
    bool pending() const noexcept { return step_ != 0; }

    void reset() noexcept { step_ = 0; partial_ = TraceEvent{}; }

private:
    /// Start a record when @p op is a first-word opcode; false otherwise.
    bool open_record(std::uint32_t op, std::uint32_t payload) noexcept;

    std::uint32_t key_;
    unsigned      step_{0};     ///< Words consumed for the current record
    TraceEvent    partial_{};
};

} // namespace kheap::obs
