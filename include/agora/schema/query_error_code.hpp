#pragma once

#include <cstdint>

// Schema type: query error code.
// Governance workflow: Query failure taxonomy. Absent initiatives are not an
// error; they decode as an empty optional.
namespace agora::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  unsupported_path = 2,
};

}  // namespace agora::schema
