#pragma once
#include <agora/schema/primitives.hpp>

// Schema type: participation record.
// Governance workflow: Participation Registry row keyed by
// (initiative, participant). Set once by a signal, never reset.
namespace agora::schema {

template <uint16_t Version>
struct participation_record;

template <>
struct participation_record<1> final {
  uint16_t version{1};
  bool participated{};
  sequence_t participation_sequence{};
};

using participation_record_t = participation_record<1>;

}  // namespace agora::schema
