#pragma once

#include <agora/schema/initiative_state.hpp>
#include <agora/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Deliberation window evaluation. Expiry is derived on read from the stored
// genesis sequence and span; nothing ever flips `active` when a window
// closes.
namespace agora::execution {

/// First sequence at which the initiative no longer accepts signals.
/// Saturates at the largest sequence instead of wrapping.
agora::schema::sequence_t expiry_sequence(
    const agora::schema::initiative_state_t& initiative);

/// True while the initiative has not been terminated and
/// `current_sequence` is before its expiry sequence.
bool is_active(const agora::schema::initiative_state_t& initiative,
               agora::schema::sequence_t current_sequence);

/// Same as above, false when the initiative does not exist.
bool is_active(
    const std::optional<agora::schema::initiative_state_t>& initiative,
    agora::schema::sequence_t current_sequence);

/// Blocks left until expiry. Negative once the window has closed, saturated
/// to the `int64_t` range.
int64_t remaining(const agora::schema::initiative_state_t& initiative,
                  agora::schema::sequence_t current_sequence);

/// Same as above, 0 when the initiative does not exist.
int64_t remaining(
    const std::optional<agora::schema::initiative_state_t>& initiative,
    agora::schema::sequence_t current_sequence);

}  // namespace agora::execution
