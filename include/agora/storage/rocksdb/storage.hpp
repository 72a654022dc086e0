#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <agora/common/critical.hpp>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace agora::storage {

namespace detail {

using encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const agora::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline agora::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const agora::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const agora::schema::bytes_view_t& key,
           const T& value) const;

  void write_batch(const std::vector<key_value_entry_t>& entries) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const agora::schema::bytes_view_t& prefix) const;
  std::vector<key_value_entry_t> list_from(
      const agora::schema::bytes_view_t& start,
      const agora::schema::bytes_view_t& prefix) const;

 private:
  void require_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    agora::common::critical("RocksDB database is not initialized");
  }
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const agora::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    agora::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(agora::schema::make_bytes_view(value))};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const agora::schema::bytes_view_t& key,
                                       const T& value) const {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(agora::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    agora::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<key_value_entry_t>& entries) const {
  require_open();
  if (entries.empty()) {
    return;
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(agora::schema::make_bytes_view(key)),
                  detail::to_slice(agora::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      agora::common::critical("failed staging key in write batch");
    }
  }
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB write batch: {}",
                  write_status.ToString());
    agora::common::critical("failed to commit write batch");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_open();
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    agora::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, agora::schema::hash32_t>>(
          agora::schema::make_bytes_view(committed_raw));
  if (!decoded.has_value()) {
    agora::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  require_open();
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  auto state_status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      std::string{detail::kCommittedHeightKey},
      detail::to_slice(agora::schema::make_bytes_view(encoded)));
  if (!state_status.ok()) {
    agora::common::critical("failed to persist committed height");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const agora::schema::bytes_view_t& prefix) const {
  return list_from(prefix, prefix);
}

inline std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_from(
    const agora::schema::bytes_view_t& start,
    const agora::schema::bytes_view_t& prefix) const {
  require_open();
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_view = agora::schema::make_string_view(prefix);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(start)); iterator->Valid();
       iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_view)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    agora::common::critical("failed to list keys by prefix");
  }
  return entries;
}

}  // namespace agora::storage
