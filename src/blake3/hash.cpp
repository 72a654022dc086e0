#include <blake3.h>
#include <agora/blake3/hash.hpp>

namespace agora::blake3 {

namespace {

agora::schema::hash32_t digest(const void* data, const size_t size) {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<agora::schema::hash32_t>);
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = agora::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

agora::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

agora::schema::hash32_t hash(const agora::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace agora::blake3
