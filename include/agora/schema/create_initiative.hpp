#pragma once
#include <agora/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: create initiative.
// Governance workflow: Guardian-only registration of a new initiative. When
// `deliberation_span` is absent the standard span is applied.
namespace agora::schema {

template <uint16_t Version>
struct create_initiative;

template <>
struct create_initiative<1> final {
  uint16_t version{1};
  std::string title;
  std::string summary;
  std::optional<sequence_t> deliberation_span;
};

using create_initiative_t = create_initiative<1>;

}  // namespace agora::schema
