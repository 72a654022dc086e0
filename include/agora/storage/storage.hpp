#pragma once
#include <agora/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace agora::storage {

using key_value_entry_t =
    std::pair<agora::schema::bytes_t, agora::schema::bytes_t>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  agora::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const agora::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const agora::schema::bytes_view_t& key,
           const T& value) const;

  /// Persist all entries atomically: either every entry is visible
  /// afterwards or none is.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const agora::schema::bytes_view_t& prefix) const;

  /// Same as `list_by_prefix`, but starts at the first key not below
  /// `start` instead of at the beginning of the keyspace.
  std::vector<key_value_entry_t> list_from(
      const agora::schema::bytes_view_t& start,
      const agora::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace agora::storage
