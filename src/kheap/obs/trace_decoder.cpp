/**
 * @file trace_decoder.cpp
 * @brief TraceDecoder state machine.
 */
#include "kheap/obs/trace_decoder.hpp"

namespace kheap::obs {

using namespace kheap::config::constants;

namespace {

bool is_known(std::uint32_t op) noexcept {
    switch (op) {
        case TRACE_OP_ALLOC_1:  case TRACE_OP_ALLOC_2:
        case TRACE_OP_DEALLOC_1: case TRACE_OP_DEALLOC_2:
        case TRACE_OP_GROW_1:   case TRACE_OP_GROW_2:   case TRACE_OP_GROW_3:
        case TRACE_OP_SHRINK_1: case TRACE_OP_SHRINK_2: case TRACE_OP_SHRINK_3:
            return true;
        default:
            return false;
    }
}

/// Opcode expected for word @p step (1-based past the first) of a record of kind @p op.
std::uint32_t expected_opcode(TraceOp op, unsigned step) noexcept {
    switch (op) {
        case TraceOp::Allocate:   return TRACE_OP_ALLOC_2;
        case TraceOp::Deallocate: return TRACE_OP_DEALLOC_2;
        case TraceOp::Grow:       return step == 1 ? TRACE_OP_GROW_2 : TRACE_OP_GROW_3;
        case TraceOp::Shrink:     return step == 1 ? TRACE_OP_SHRINK_2 : TRACE_OP_SHRINK_3;
    }
    return 0;
}

} // namespace

kheap_detail::expected<std::optional<TraceEvent>, TraceDecodeError>
TraceDecoder::feed(std::uint32_t raw) noexcept {
    const std::uint32_t word    = raw ^ key_;
    const std::uint32_t op      = word >> TRACE_OP_SHIFT;
    const std::uint32_t payload = word & 0x00FFFFFFU;

    if (!is_known(op)) {
        reset();
        return kheap_detail::unexpected<TraceDecodeError>(TraceDecodeError::UnknownOpcode);
    }

    if (step_ != 0) {
        if (op != expected_opcode(partial_.op, step_)) {
            // Broken record: drop it. A first-word opcode still opens a new one.
            reset();
            open_record(op, payload);
            return kheap_detail::unexpected<TraceDecodeError>(TraceDecodeError::OutOfSequence);
        }
        const bool two_word = partial_.op == TraceOp::Allocate || partial_.op == TraceOp::Deallocate;
        if (two_word) {
            partial_.size |= payload & 0xFF;
        } else if (step_ == 1) {
            partial_.size    |= (payload >> 16) & 0xFF;
            partial_.new_size = (payload & 0xFFFF) << 16;
            step_ = 2;
            return std::optional<TraceEvent>{};
        } else {
            partial_.new_size |= payload & 0xFFFF;
        }
        const TraceEvent done = partial_;
        reset();
        return std::optional<TraceEvent>{done};
    }

    if (!open_record(op, payload)) {
        return kheap_detail::unexpected<TraceDecodeError>(TraceDecodeError::OutOfSequence);
    }
    return std::optional<TraceEvent>{};
}

bool TraceDecoder::open_record(std::uint32_t op, std::uint32_t payload) noexcept {
    switch (op) {
        case TRACE_OP_ALLOC_1:   partial_.op = TraceOp::Allocate;   break;
        case TRACE_OP_DEALLOC_1: partial_.op = TraceOp::Deallocate; break;
        case TRACE_OP_GROW_1:    partial_.op = TraceOp::Grow;       break;
        case TRACE_OP_SHRINK_1:  partial_.op = TraceOp::Shrink;     break;
        default:
            return false;
    }
    partial_.size     = (payload & 0xFF) << 24;
    partial_.new_size = 0;
    step_ = 1;
    return true;
}

} // namespace kheap::obs
