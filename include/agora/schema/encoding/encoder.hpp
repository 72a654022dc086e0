#pragma once
#include <agora/schema/primitives.hpp>
#include <optional>

namespace agora::schema::encoding {

// The wire codec is a build time choice selected by tag. Callers name
// `encoder<scale_encoder_tag>` (or an alias of it) and never the library
// types directly.
template <typename Library>
struct encoder {
  template <typename T>
  agora::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, agora::schema::bytes_t& out);

  template <typename T>
  T decode(const agora::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const agora::schema::bytes_view_t& bytes);
};

}  // namespace agora::schema::encoding
