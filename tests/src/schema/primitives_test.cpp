#include <gtest/gtest.h>
#include <accountstore/blake3/hash.hpp>
#include <accountstore/schema/primitives.hpp>

#include <limits>
#include <string>

TEST(primitives, hex_round_trips_bytes) {
  auto payload = accountstore::schema::bytes_t{0x00, 0x01, 0x7F, 0xFE, 0xFF};
  auto hex = accountstore::schema::to_hex(
      accountstore::schema::bytes_view_t{payload.data(), payload.size()});
  EXPECT_EQ(hex, "00017ffeff");
  auto decoded = accountstore::schema::try_from_hex(hex);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, payload);
}

TEST(primitives, try_from_hex_accepts_prefix_and_rejects_garbage) {
  auto decoded = accountstore::schema::try_from_hex("0xABcd");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, (accountstore::schema::bytes_t{0xAB, 0xCD}));

  EXPECT_FALSE(accountstore::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(accountstore::schema::try_from_hex("zz").has_value());
}

TEST(primitives, try_parse_int64_accepts_signed_decimal) {
  EXPECT_EQ(accountstore::schema::try_parse_int64("100"), 100);
  EXPECT_EQ(accountstore::schema::try_parse_int64("-30"), -30);
  EXPECT_EQ(accountstore::schema::try_parse_int64("+7"), 7);
  EXPECT_EQ(accountstore::schema::try_parse_int64("0"), 0);
  EXPECT_EQ(accountstore::schema::try_parse_int64("9223372036854775807"),
            std::numeric_limits<int64_t>::max());
  EXPECT_EQ(accountstore::schema::try_parse_int64("-9223372036854775808"),
            std::numeric_limits<int64_t>::min());
}

TEST(primitives, try_parse_int64_rejects_malformed_input) {
  EXPECT_FALSE(accountstore::schema::try_parse_int64("").has_value());
  EXPECT_FALSE(accountstore::schema::try_parse_int64("+").has_value());
  EXPECT_FALSE(accountstore::schema::try_parse_int64("+-1").has_value());
  EXPECT_FALSE(accountstore::schema::try_parse_int64("12abc").has_value());
  EXPECT_FALSE(accountstore::schema::try_parse_int64(" 12").has_value());
  EXPECT_FALSE(accountstore::schema::try_parse_int64("1.5").has_value());
  EXPECT_FALSE(
      accountstore::schema::try_parse_int64("9223372036854775808").has_value());
}

TEST(primitives, blake3_hex_digest_is_deterministic) {
  auto first = accountstore::blake3::hex_digest("secret");
  auto second = accountstore::blake3::hex_digest("secret");
  EXPECT_EQ(first, second);
  EXPECT_EQ(first.size(), 64u);
  EXPECT_NE(first, accountstore::blake3::hex_digest("Secret"));
  // Known BLAKE3 digest of the empty input.
  EXPECT_EQ(accountstore::blake3::hex_digest(""),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}
