#include <gtest/gtest.h>
#include <agora/schema/primitives.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = agora::schema::bytes_t(32, 0xAB);
  auto hash = agora::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = agora::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_and_non_hex_input) {
  EXPECT_FALSE(agora::schema::try_make_hash32(std::string_view{"0102"}));
  EXPECT_FALSE(agora::schema::try_make_hash32(std::string_view{
      "zz02030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20"}));
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = agora::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_encoding_is_lowercase_and_reversible) {
  auto payload = agora::schema::bytes_t{0x00, 0x7F, 0xAB, 0xFF};
  auto hex = agora::schema::to_hex(payload);
  EXPECT_EQ(hex, "007fabff");
  EXPECT_EQ(agora::schema::from_hex(hex), payload);
  EXPECT_EQ(agora::schema::from_hex("0X007FABFF"), payload);
  EXPECT_FALSE(agora::schema::try_from_hex("abc").has_value());
}

TEST(primitives, base64_round_trips_bytes) {
  auto payload = agora::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = agora::schema::to_base64(payload);
  auto decoded = agora::schema::from_base64(encoded);
  EXPECT_EQ(decoded, payload);
}

TEST(primitives, base64_padding_matches_rfc4648) {
  EXPECT_EQ(agora::schema::to_base64(agora::schema::make_bytes(
                std::string_view{"f"})),
            "Zg==");
  EXPECT_EQ(agora::schema::to_base64(agora::schema::make_bytes(
                std::string_view{"fo"})),
            "Zm8=");
  EXPECT_EQ(agora::schema::to_base64(agora::schema::make_bytes(
                std::string_view{"foo"})),
            "Zm9v");
  EXPECT_EQ(agora::schema::make_string(agora::schema::from_base64("Zm9vYg==")),
            "foob");
}

TEST(primitives, try_from_base64_rejects_invalid_input) {
  auto decoded = agora::schema::try_from_base64("not base64***");
  EXPECT_FALSE(decoded.has_value());
  EXPECT_FALSE(agora::schema::try_from_base64("Zg==Zg==").has_value());
}
