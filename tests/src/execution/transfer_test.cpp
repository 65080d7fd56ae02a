#include <accountstore/common/error.hpp>
#include <accountstore/execution/transfer.hpp>
#include <accountstore/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string>

using accountstore::schema::error_code;
using accountstore::testing::ledger_fixture;

namespace {

class transfer_test : public ::testing::Test {
 protected:
  void SetUp() override {
    auto context = ledger_.begin("setup");
    accounts_.create(context, "A1", "EUR", 100, "a@x");
    accounts_.create(context, "A2", "EUR", 50, "a@x");
    accounts_.create(context, "U1", "USD", 10, "b@x");
    context.commit();
  }

  void transfer(const std::string& sender,
                const std::string& recipient,
                accountstore::schema::balance_t amount) {
    auto context = ledger_.begin("transfer-" + std::to_string(++sequence_));
    transfers_.transfer(context, sender, recipient, amount);
    context.commit();
  }

  error_code failed_transfer(const std::string& sender,
                             const std::string& recipient,
                             accountstore::schema::balance_t amount) {
    try {
      transfer(sender, recipient, amount);
    } catch (const accountstore::common::error& e) {
      return e.code();
    }
    ADD_FAILURE() << "transfer was expected to fail";
    return error_code::storage_unavailable;
  }

  accountstore::schema::balance_t balance(const std::string& id) {
    auto context = ledger_.begin("balance-" + id);
    return accounts_.read(context, id).balance;
  }

  std::size_t versions(const std::string& id) {
    auto context = ledger_.begin("history-" + id);
    auto history = context.history_of(id);
    auto count = std::size_t{};
    while (history.has_next()) {
      history.next();
      ++count;
    }
    return count;
  }

  ledger_fixture ledger_{"accountstore_transfer"};
  accountstore::registry::account_registry accounts_{ledger_.encoder()};
  accountstore::execution::transfer_engine transfers_{accounts_};
  int sequence_{};
};

}  // namespace

TEST_F(transfer_test, moves_amount_and_conserves_total) {
  transfer("A1", "A2", 30);
  EXPECT_EQ(balance("A1"), 70);
  EXPECT_EQ(balance("A2"), 80);
  EXPECT_EQ(balance("A1") + balance("A2"), 150);
}

TEST_F(transfer_test, zero_amount_rewrites_both_accounts_unchanged) {
  transfer("A1", "A2", 0);
  EXPECT_EQ(balance("A1"), 100);
  EXPECT_EQ(balance("A2"), 50);
  EXPECT_EQ(versions("A1"), 2u);
  EXPECT_EQ(versions("A2"), 2u);
}

TEST_F(transfer_test, overdraft_and_negative_amounts_are_permitted) {
  transfer("A2", "A1", 80);
  EXPECT_EQ(balance("A2"), -30);
  EXPECT_EQ(balance("A1"), 180);

  transfer("A1", "A2", -20);
  EXPECT_EQ(balance("A1"), 200);
  EXPECT_EQ(balance("A2"), -50);
}

TEST_F(transfer_test, currency_mismatch_leaves_state_untouched) {
  EXPECT_EQ(failed_transfer("A1", "U1", 5), error_code::currency_mismatch);
  EXPECT_EQ(balance("A1"), 100);
  EXPECT_EQ(balance("U1"), 10);
  EXPECT_EQ(versions("A1"), 1u);
  EXPECT_EQ(versions("U1"), 1u);
}

TEST_F(transfer_test, missing_account_is_not_found) {
  EXPECT_EQ(failed_transfer("A1", "A404", 5), error_code::not_found);
  EXPECT_EQ(failed_transfer("A404", "A1", 5), error_code::not_found);
  EXPECT_EQ(balance("A1"), 100);
  EXPECT_EQ(versions("A1"), 1u);
}

TEST_F(transfer_test, self_transfer_is_rejected) {
  EXPECT_EQ(failed_transfer("A1", "A1", 5), error_code::same_account);
  EXPECT_EQ(balance("A1"), 100);
  EXPECT_EQ(versions("A1"), 1u);
}

TEST_F(transfer_test, replaying_a_transfer_applies_it_again) {
  transfer("A1", "A2", 30);
  transfer("A1", "A2", 30);
  EXPECT_EQ(balance("A1"), 40);
  EXPECT_EQ(balance("A2"), 110);
}

TEST_F(transfer_test, balances_wrap_around_at_the_int64_boundary) {
  constexpr auto kMax =
      std::numeric_limits<accountstore::schema::balance_t>::max();
  constexpr auto kMin =
      std::numeric_limits<accountstore::schema::balance_t>::min();
  {
    auto context = ledger_.begin("create-max");
    accounts_.create(context, "MAX", "EUR", kMax, "c@x");
    context.commit();
  }

  transfer("A1", "MAX", 1);
  EXPECT_EQ(balance("A1"), 99);
  EXPECT_EQ(balance("MAX"), kMin);

  transfer("A2", "A1", kMin);
  EXPECT_EQ(balance("A2"), kMin + 50);
  EXPECT_EQ(balance("A1"), kMin + 99);
}
