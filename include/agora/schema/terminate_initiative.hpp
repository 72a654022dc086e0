#pragma once
#include <agora/schema/primitives.hpp>

// Schema type: terminate initiative.
// Governance workflow: Guardian-only, idempotent deactivation.
namespace agora::schema {

template <uint16_t Version>
struct terminate_initiative;

template <>
struct terminate_initiative<1> final {
  uint16_t version{1};
  initiative_id_t initiative_id{};
};

using terminate_initiative_t = terminate_initiative<1>;

}  // namespace agora::schema
