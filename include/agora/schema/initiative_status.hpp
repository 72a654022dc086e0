#pragma once
#include <agora/schema/initiative_state.hpp>
#include <agora/schema/primitives.hpp>

// Schema type: initiative status.
// Governance workflow: Read API snapshot of an initiative evaluated at a
// given sequence. `remaining` is signed and goes negative once expired.
namespace agora::schema {

template <uint16_t Version>
struct initiative_status;

template <>
struct initiative_status<1> final {
  uint16_t version{1};
  initiative_state_t initiative;
  bool is_active{};
  int64_t remaining{};
  sequence_t evaluated_at{};
};

using initiative_status_t = initiative_status<1>;

}  // namespace agora::schema
