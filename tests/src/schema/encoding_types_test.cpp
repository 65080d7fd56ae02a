#include <accountstore/schema/encoding/scale/encoder.hpp>
#include <accountstore/schema/history_entry.hpp>
#include <accountstore/schema/invocation.hpp>
#include <accountstore/schema/invocation_result.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using encoder_t = accountstore::schema::encoding::encoder<
    accountstore::schema::encoding::scale_encoder_tag>;

template <typename T>
T round_trip(const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  return encoder.decode<T>(
      accountstore::schema::bytes_view_t{encoded.data(), encoded.size()});
}

accountstore::schema::account_t make_account() {
  auto account = accountstore::schema::account_t{};
  account.id = "A1";
  account.currency = "EUR";
  account.balance = -42;
  account.email = "a@x";
  return account;
}

}  // namespace

TEST(encoding_types, participant_preserves_every_field) {
  auto participant = accountstore::schema::participant_t{};
  participant.email = "a@x";
  participant.name = "Ann";
  participant.surname = "Lee";
  participant.phone = "+100";
  participant.password_digest = "abcdef";

  auto decoded = round_trip(participant);
  EXPECT_EQ(decoded, participant);
  EXPECT_EQ(decoded.doc_type, "participant");
  EXPECT_EQ(decoded.version, 1u);
}

TEST(encoding_types, account_preserves_negative_balance) {
  auto decoded = round_trip(make_account());
  EXPECT_EQ(decoded, make_account());
  EXPECT_EQ(decoded.balance, -42);
}

TEST(encoding_types, history_entry_keeps_variant_alternative) {
  auto snapshot = accountstore::schema::history_entry_t{};
  snapshot.record =
      accountstore::schema::account_snapshot{.account = make_account()};
  snapshot.tx_id = "tx-1";
  snapshot.timestamp = 1234;

  auto tombstone = accountstore::schema::history_entry_t{};
  tombstone.record = accountstore::schema::account_tombstone{.id = "A1"};
  tombstone.tx_id = "tx-2";
  tombstone.timestamp = 5678;

  auto decoded = round_trip(
      std::vector<accountstore::schema::history_entry_t>{snapshot, tombstone});
  ASSERT_EQ(decoded.size(), 2u);
  EXPECT_FALSE(accountstore::schema::is_delete(decoded[0]));
  EXPECT_EQ(accountstore::schema::materialize(decoded[0].record),
            make_account());
  EXPECT_EQ(decoded[0].tx_id, "tx-1");
  EXPECT_EQ(decoded[0].timestamp, 1234u);

  EXPECT_TRUE(accountstore::schema::is_delete(decoded[1]));
  auto placeholder = accountstore::schema::materialize(decoded[1].record);
  EXPECT_EQ(placeholder.id, "A1");
  EXPECT_TRUE(placeholder.currency.empty());
  EXPECT_EQ(placeholder.balance, 0);
  EXPECT_EQ(decoded[1].tx_id, "tx-2");
}

TEST(encoding_types, invocation_envelopes_preserve_fields) {
  auto invocation = accountstore::schema::invocation_t{};
  invocation.function = "transfer";
  invocation.args = {"A1", "A2", "30"};
  invocation.tx_id = "tx-9";
  auto decoded_invocation = round_trip(invocation);
  EXPECT_EQ(decoded_invocation.function, invocation.function);
  EXPECT_EQ(decoded_invocation.args, invocation.args);
  EXPECT_EQ(decoded_invocation.tx_id, invocation.tx_id);

  auto result = accountstore::schema::invocation_result_t{};
  result.code = 5;
  result.log = "currency mismatch EUR != USD";
  result.info = "currency_mismatch";
  result.payload = {0x01, 0x02};
  result.tx_id = "tx-9";
  result.codespace = "accountstore";
  auto decoded_result = round_trip(result);
  EXPECT_EQ(decoded_result.code, result.code);
  EXPECT_EQ(decoded_result.log, result.log);
  EXPECT_EQ(decoded_result.info, result.info);
  EXPECT_EQ(decoded_result.payload, result.payload);
  EXPECT_EQ(decoded_result.tx_id, result.tx_id);
  EXPECT_EQ(decoded_result.codespace, result.codespace);
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(make_account());
  encoded.resize(encoded.size() / 2);
  auto decoded = encoder.try_decode<accountstore::schema::account_t>(
      accountstore::schema::bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_FALSE(decoded.has_value());
}
