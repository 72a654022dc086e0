#pragma once
#include <agora/common/critical.hpp>
#include <agora/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Schema aggregates are SCALE encoded as the concatenation of their fields in
// declaration order, variants as a one byte index followed by the
// alternative, optionals with a one byte presence flag.
namespace agora::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  agora::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, agora::schema::bytes_t& out);

  template <typename T>
  T decode(const agora::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const agora::schema::bytes_view_t& bytes);
};

template <typename T>
agora::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    agora::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        agora::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const agora::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    agora::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const agora::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace agora::schema::encoding
