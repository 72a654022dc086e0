#pragma once
#include <agora/schema/primitives.hpp>
#include <string_view>

namespace agora::blake3 {

agora::schema::hash32_t hash(const std::string_view& str);
agora::schema::hash32_t hash(const agora::schema::bytes_view_t& bytes);

}  // namespace agora::blake3
