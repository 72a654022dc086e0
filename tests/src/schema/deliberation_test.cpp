#include <gtest/gtest.h>
#include <agora/schema/deliberation.hpp>
#include <agora/schema/transaction_error_code.hpp>

#include <string>

TEST(deliberation, span_bounds_are_inclusive) {
  using namespace agora::schema;
  static_assert(kMinDeliberationSpan == 144);
  static_assert(kMaxDeliberationSpan == 4320);
  static_assert(is_valid_deliberation_span(kDefaultDeliberationSpan));

  EXPECT_TRUE(is_valid_deliberation_span(kMinDeliberationSpan));
  EXPECT_TRUE(is_valid_deliberation_span(kMaxDeliberationSpan));
  EXPECT_FALSE(is_valid_deliberation_span(kMinDeliberationSpan - 1));
  EXPECT_FALSE(is_valid_deliberation_span(kMaxDeliberationSpan + 1));
  EXPECT_FALSE(is_valid_deliberation_span(0));
}

TEST(deliberation, title_and_summary_lengths) {
  using namespace agora::schema;
  EXPECT_FALSE(is_valid_title(""));
  EXPECT_TRUE(is_valid_title("a"));
  EXPECT_TRUE(is_valid_title(std::string(kMaxTitleLength, 't')));
  EXPECT_FALSE(is_valid_title(std::string(kMaxTitleLength + 1, 't')));

  EXPECT_FALSE(is_valid_summary(""));
  EXPECT_TRUE(is_valid_summary(std::string(kMaxSummaryLength, 's')));
  EXPECT_FALSE(is_valid_summary(std::string(kMaxSummaryLength + 1, 's')));
}

TEST(transaction_error_code, names_are_stable) {
  using agora::schema::transaction_error_code;
  EXPECT_EQ(agora::schema::to_string(transaction_error_code::unauthorized_access),
            "unauthorized_access");
  EXPECT_EQ(agora::schema::to_string(
                transaction_error_code::deliberation_window_exceeded),
            "deliberation_window_exceeded");
  EXPECT_EQ(static_cast<uint32_t>(transaction_error_code::duplicate_participation),
            101u);
  EXPECT_EQ(static_cast<uint32_t>(transaction_error_code::initiative_not_found),
            105u);

  auto parsed = agora::schema::try_from_string<transaction_error_code>(
      "deliberation_expired");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, transaction_error_code::deliberation_expired);
  EXPECT_FALSE(agora::schema::try_from_string<transaction_error_code>("nope")
                   .has_value());
}
