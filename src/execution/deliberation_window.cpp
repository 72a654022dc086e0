#include <agora/execution/deliberation_window.hpp>

#include <limits>

namespace agora::execution {

agora::schema::sequence_t expiry_sequence(
    const agora::schema::initiative_state_t& initiative) {
  constexpr auto kMaxSequence =
      std::numeric_limits<agora::schema::sequence_t>::max();
  if (initiative.genesis_sequence > kMaxSequence - initiative.deliberation_span) {
    return kMaxSequence;
  }
  return initiative.genesis_sequence + initiative.deliberation_span;
}

bool is_active(const agora::schema::initiative_state_t& initiative,
               const agora::schema::sequence_t current_sequence) {
  return initiative.active && current_sequence < expiry_sequence(initiative);
}

bool is_active(
    const std::optional<agora::schema::initiative_state_t>& initiative,
    const agora::schema::sequence_t current_sequence) {
  return initiative.has_value() && is_active(*initiative, current_sequence);
}

int64_t remaining(const agora::schema::initiative_state_t& initiative,
                  const agora::schema::sequence_t current_sequence) {
  constexpr auto kMaxRemaining =
      static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  auto expiry = expiry_sequence(initiative);
  if (expiry >= current_sequence) {
    auto ahead = expiry - current_sequence;
    return ahead > kMaxRemaining ? std::numeric_limits<int64_t>::max()
                                 : static_cast<int64_t>(ahead);
  }
  auto behind = current_sequence - expiry;
  return behind > kMaxRemaining ? std::numeric_limits<int64_t>::min()
                                : -static_cast<int64_t>(behind);
}

int64_t remaining(
    const std::optional<agora::schema::initiative_state_t>& initiative,
    const agora::schema::sequence_t current_sequence) {
  if (!initiative.has_value()) {
    return 0;
  }
  return remaining(*initiative, current_sequence);
}

}  // namespace agora::execution
