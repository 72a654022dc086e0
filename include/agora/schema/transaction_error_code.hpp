#pragma once

#include <agora/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace agora::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  unauthorized_access = 100,
  duplicate_participation = 101,
  invalid_initiative = 102,
  deliberation_expired = 103,
  malformed_input = 104,
  initiative_not_found = 105,
  // Reserved. Span bound violations currently report malformed_input.
  deliberation_window_exceeded = 106,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "unauthorized_access", transaction_error_code::unauthorized_access},
    std::pair<std::string_view, transaction_error_code>{
        "duplicate_participation",
        transaction_error_code::duplicate_participation},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_initiative", transaction_error_code::invalid_initiative},
    std::pair<std::string_view, transaction_error_code>{
        "deliberation_expired", transaction_error_code::deliberation_expired},
    std::pair<std::string_view, transaction_error_code>{
        "malformed_input", transaction_error_code::malformed_input},
    std::pair<std::string_view, transaction_error_code>{
        "initiative_not_found", transaction_error_code::initiative_not_found},
    std::pair<std::string_view, transaction_error_code>{
        "deliberation_window_exceeded",
        transaction_error_code::deliberation_window_exceeded}};

template <>
inline std::optional<transaction_error_code>
try_from_string<transaction_error_code>(const std::string_view value) {
  return from_string(value, kTransactionErrorCodeMappings);
}

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace agora::schema
