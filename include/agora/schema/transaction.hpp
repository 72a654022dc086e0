#pragma once
#include <agora/schema/configure_default_span.hpp>
#include <agora/schema/create_initiative.hpp>
#include <agora/schema/primitives.hpp>
#include <agora/schema/signal_initiative.hpp>
#include <agora/schema/terminate_initiative.hpp>
#include <variant>

namespace agora::schema {

using transaction_payload_t = std::variant<create_initiative_t,
                                           signal_initiative_t,
                                           terminate_initiative_t,
                                           configure_default_span_t>;

template <uint16_t Version>
struct transaction;

// The host authenticates `signer` before handing the transaction to the
// engine.
template <>
struct transaction<1> final {
  uint16_t version{1};
  account_id_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace agora::schema
