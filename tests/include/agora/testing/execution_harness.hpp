#pragma once

#include <gtest/gtest.h>

#include <agora/execution/engine.hpp>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/initiative_status.hpp>
#include <agora/schema/transaction.hpp>
#include <agora/testing/common.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace agora::testing {

using scale_encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;

inline agora::schema::transaction_t make_transaction(
    const agora::schema::account_id_t& signer,
    const agora::schema::transaction_payload_t& payload) {
  return agora::schema::transaction_t{
      .version = 1, .signer = signer, .payload = payload};
}

inline agora::schema::bytes_t encode_transaction(
    const agora::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline agora::schema::create_initiative_t make_create(
    std::string title,
    std::string summary,
    std::optional<agora::schema::sequence_t> span = std::nullopt) {
  return agora::schema::create_initiative_t{.title = std::move(title),
                                            .summary = std::move(summary),
                                            .deliberation_span = span};
}

inline agora::schema::transaction_result_t finalize_single(
    agora::execution::engine& engine,
    const uint64_t height,
    const agora::schema::transaction_t& tx) {
  auto block = engine.finalize_block(height, {encode_transaction(tx)});
  EXPECT_EQ(block.tx_results.size(), 1u);
  auto result = block.tx_results.front();
  (void)engine.commit();
  return result;
}

inline agora::schema::transaction_result_t finalize_single(
    agora::execution::engine& engine,
    const uint64_t height,
    const agora::schema::account_id_t& signer,
    const agora::schema::transaction_payload_t& payload) {
  return finalize_single(engine, height, make_transaction(signer, payload));
}

template <typename T>
T query_value(const agora::execution::engine& engine,
              const std::string_view path,
              const agora::schema::bytes_t& data = {}) {
  const auto result = engine.query(path, agora::schema::make_bytes_view(data));
  EXPECT_EQ(result.code, 0u) << result.log;
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(agora::schema::make_bytes_view(result.value));
}

inline std::optional<agora::schema::initiative_status_t> query_status(
    const agora::execution::engine& engine,
    const agora::schema::initiative_id_t initiative_id) {
  auto encoder = scale_encoder_t{};
  return query_value<std::optional<agora::schema::initiative_status_t>>(
      engine, "/initiative/status", encoder.encode(initiative_id));
}

inline std::vector<agora::schema::history_entry_t> query_history(
    const agora::execution::engine& engine,
    const uint64_t from_height,
    const uint64_t to_height) {
  auto encoder = scale_encoder_t{};
  return query_value<std::vector<agora::schema::history_entry_t>>(
      engine, "/history/range", encoder.encode(std::tuple{from_height, to_height}));
}

}  // namespace agora::testing
