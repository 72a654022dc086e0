#pragma once
#include <agora/schema/primitives.hpp>

// Schema type: configure default span.
// Governance workflow: Guardian-only update of the standard deliberation
// span. Existing initiatives keep the span frozen at their creation.
namespace agora::schema {

template <uint16_t Version>
struct configure_default_span;

template <>
struct configure_default_span<1> final {
  uint16_t version{1};
  sequence_t deliberation_span{};
};

using configure_default_span_t = configure_default_span<1>;

}  // namespace agora::schema
