#pragma once
#include <agora/schema/primitives.hpp>
#include <string>

// Schema type: initiative state.
// Governance workflow: Initiative Store row. Created by the guardian, tallied
// by signals, deactivated by termination. Never deleted.
namespace agora::schema {

template <uint16_t Version>
struct initiative_state;

template <>
struct initiative_state<1> final {
  uint16_t version{1};
  initiative_id_t initiative_id{};
  std::string title;
  std::string summary;
  uint64_t consensus_tally{};
  bool active{true};
  account_id_t author{};
  sequence_t genesis_sequence{};
  sequence_t deliberation_span{};
};

using initiative_state_t = initiative_state<1>;

}  // namespace agora::schema
