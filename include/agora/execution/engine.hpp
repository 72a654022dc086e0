#pragma once

#include <agora/execution/governance_options.hpp>
#include <agora/schema/app_info.hpp>
#include <agora/schema/block_result.hpp>
#include <agora/schema/commit_result.hpp>
#include <agora/schema/encoding/encoder.hpp>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/history_entry.hpp>
#include <agora/schema/initiative_state.hpp>
#include <agora/schema/initiative_status.hpp>
#include <agora/schema/participation_record.hpp>
#include <agora/schema/primitives.hpp>
#include <agora/schema/query_result.hpp>
#include <agora/schema/transaction.hpp>
#include <agora/schema/transaction_error_code.hpp>
#include <agora/schema/transaction_result.hpp>
#include <agora/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace agora::execution {

/// Deterministic governance state machine.
///
/// The engine decodes transactions handed over by the host, runs the
/// guardian check and input validation for each operation, and commits every
/// accepted operation as one atomic storage batch. Block height is the
/// sequence counter for deliberation windows.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// Persists `options.guardian` and the initial standard span on a fresh
  /// store; aborts through `common::critical` when an existing store was
  /// created for a different guardian.
  explicit engine(
      agora::schema::encoding::encoder<
          agora::schema::encoding::scale_encoder_tag>& encoder,
      agora::storage::storage<agora::storage::rocksdb_storage_tag>& storage,
      governance_options options);

  /// Execute block transactions in order at sequence `height`.
  ///
  /// Per-tx results are returned even on failures. Failed transactions leave
  /// governance state untouched but are still recorded in history. Heights
  /// may repeat but must not decrease and must fit in `int64_t`.
  agora::schema::block_result_t finalize_block(
      uint64_t height,
      const std::vector<agora::schema::bytes_t>& txs);

  /// Persist the latest finalized height and state_root.
  agora::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  agora::schema::app_info_t info() const;

  /// Execute a deterministic read-path query by route.
  agora::schema::query_result_t query(
      std::string_view path,
      const agora::schema::bytes_view_t& data) const;

  /// Status of an initiative evaluated at the last finalized height.
  std::optional<agora::schema::initiative_status_t> get_status(
      agora::schema::initiative_id_t initiative_id) const;

  /// Status of an initiative evaluated at `sequence`.
  std::optional<agora::schema::initiative_status_t> get_status(
      agora::schema::initiative_id_t initiative_id,
      agora::schema::sequence_t sequence) const;

  /// Number of initiatives ever created; also the highest valid id.
  uint64_t get_total() const;

  /// False for out of range ids and for participants without a record.
  bool has_signaled(const agora::schema::account_id_t& participant,
                    agora::schema::initiative_id_t initiative_id) const;

  /// Span applied to creations that do not request one.
  agora::schema::sequence_t standard_deliberation_span() const;

  const agora::schema::account_id_t& guardian() const;

  /// Return history entries in the inclusive height range.
  std::vector<agora::schema::history_entry_t> history(
      uint64_t from_height,
      uint64_t to_height) const;

 private:
  /// Execute a decoded transaction at `sequence`, staging its writes.
  ///
  /// `writes` is only appended to when the returned code is 0.
  agora::schema::transaction_result_t execute_operation(
      const agora::schema::transaction_t& tx,
      agora::schema::sequence_t sequence,
      std::vector<agora::storage::key_value_entry_t>& writes);

  agora::schema::transaction_result_t create_initiative(
      const agora::schema::account_id_t& caller,
      const agora::schema::create_initiative_t& operation,
      agora::schema::sequence_t sequence,
      std::vector<agora::storage::key_value_entry_t>& writes);

  agora::schema::transaction_result_t signal_initiative(
      const agora::schema::account_id_t& caller,
      const agora::schema::signal_initiative_t& operation,
      agora::schema::sequence_t sequence,
      std::vector<agora::storage::key_value_entry_t>& writes);

  agora::schema::transaction_result_t terminate_initiative(
      const agora::schema::account_id_t& caller,
      const agora::schema::terminate_initiative_t& operation,
      std::vector<agora::storage::key_value_entry_t>& writes);

  agora::schema::transaction_result_t configure_default_span(
      const agora::schema::account_id_t& caller,
      const agora::schema::configure_default_span_t& operation,
      std::vector<agora::storage::key_value_entry_t>& writes);

  std::optional<agora::schema::initiative_state_t> load_initiative(
      agora::schema::initiative_id_t initiative_id) const;
  std::optional<agora::schema::participation_record_t> load_participation(
      agora::schema::initiative_id_t initiative_id,
      const agora::schema::account_id_t& participant) const;
  uint64_t load_total() const;
  bool load_signaled(const agora::schema::account_id_t& participant,
                     agora::schema::initiative_id_t initiative_id) const;
  std::vector<agora::schema::history_entry_t> load_history(
      uint64_t from_height,
      uint64_t to_height) const;
  agora::schema::sequence_t load_standard_span() const;
  std::optional<agora::schema::initiative_status_t> make_status(
      agora::schema::initiative_id_t initiative_id,
      agora::schema::sequence_t sequence) const;

  template <typename T>
  void stage(std::vector<agora::storage::key_value_entry_t>& writes,
             const agora::schema::bytes_t& key,
             const T& value) {
    writes.emplace_back(key, encoder_.encode(value));
  }

  /// Load committed state, history position and guardian/config rows at
  /// startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  agora::schema::encoding::encoder<agora::schema::encoding::scale_encoder_tag>&
      encoder_;
  agora::storage::storage<agora::storage::rocksdb_storage_tag>& storage_;
  governance_options options_;
  int64_t last_committed_height_{};
  agora::schema::hash32_t last_committed_state_root_{};
  std::optional<int64_t> pending_height_{};
  agora::schema::hash32_t pending_state_root_{};
  uint64_t current_block_height_{};
  uint64_t next_history_position_{};
};

}  // namespace agora::execution
