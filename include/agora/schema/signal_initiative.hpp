#pragma once
#include <agora/schema/primitives.hpp>

// Schema type: signal initiative.
// Governance workflow: One-time, non-retractable consensus signal by any
// identity while the initiative is active.
namespace agora::schema {

template <uint16_t Version>
struct signal_initiative;

template <>
struct signal_initiative<1> final {
  uint16_t version{1};
  initiative_id_t initiative_id{};
};

using signal_initiative_t = signal_initiative<1>;

}  // namespace agora::schema
