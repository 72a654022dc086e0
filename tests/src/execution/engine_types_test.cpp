#include <agora/execution/engine.hpp>
#include <agora/execution/governance_options.hpp>
#include <gtest/gtest.h>

TEST(engine_types, defaults_are_stable) {
  auto tx = agora::schema::transaction_result_t{};
  EXPECT_EQ(tx.code, 0u);
  EXPECT_TRUE(tx.data.empty());
  EXPECT_TRUE(tx.events.empty());

  auto block = agora::schema::block_result_t{};
  EXPECT_TRUE(block.tx_results.empty());

  auto commit = agora::schema::commit_result_t{};
  EXPECT_EQ(commit.retain_height, 0);
  EXPECT_EQ(commit.committed_height, 0);

  auto info = agora::schema::app_info_t{};
  EXPECT_EQ(info.data, "agora-governance");
  EXPECT_EQ(info.version, "0.1.0");
  EXPECT_EQ(info.last_block_height, 0);
}

TEST(engine_types, governance_options_default_to_standard_span) {
  auto options = agora::execution::governance_options{};
  EXPECT_EQ(options.standard_deliberation_span,
            agora::schema::kDefaultDeliberationSpan);

  auto guardian = agora::schema::account_id_t{};
  guardian[0] = 1;
  options.guardian = guardian;
  EXPECT_TRUE(options.is_guardian(guardian));
  EXPECT_FALSE(options.is_guardian(agora::schema::account_id_t{}));
}

TEST(engine_types, initiative_defaults_to_active) {
  auto initiative = agora::schema::initiative_state_t{};
  EXPECT_TRUE(initiative.active);
  EXPECT_EQ(initiative.consensus_tally, 0u);

  auto record = agora::schema::participation_record_t{};
  EXPECT_FALSE(record.participated);
}
