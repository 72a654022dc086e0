#pragma once

#include <agora/schema/deliberation.hpp>
#include <agora/schema/primitives.hpp>

namespace agora::execution {

/// Start-up configuration of the governance state machine.
///
/// `guardian` is the single identity allowed to create, terminate and
/// reconfigure initiatives. It is persisted the first time a store is opened
/// and must match on every later start. `standard_deliberation_span` seeds
/// the configurable default span of a fresh store and is ignored once the
/// store holds one.
struct governance_options final {
  agora::schema::account_id_t guardian{};
  agora::schema::sequence_t standard_deliberation_span{
      agora::schema::kDefaultDeliberationSpan};

  bool is_guardian(const agora::schema::account_id_t& caller) const {
    return caller == guardian;
  }
};

}  // namespace agora::execution
