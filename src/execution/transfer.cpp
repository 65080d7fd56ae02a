#include <spdlog/spdlog.h>
#include <accountstore/common/error.hpp>
#include <accountstore/execution/transfer.hpp>
#include <cstdint>

using accountstore::common::error;
using accountstore::schema::balance_t;
using accountstore::schema::error_code;

namespace {

// Balances wrap around in two's complement instead of overflowing.
balance_t wrapping_add(const balance_t lhs, const balance_t rhs) {
  return static_cast<balance_t>(static_cast<uint64_t>(lhs) +
                                static_cast<uint64_t>(rhs));
}

balance_t wrapping_sub(const balance_t lhs, const balance_t rhs) {
  return static_cast<balance_t>(static_cast<uint64_t>(lhs) -
                                static_cast<uint64_t>(rhs));
}

}  // namespace

namespace accountstore::execution {

transfer_engine::transfer_engine(
    const accountstore::registry::account_registry& accounts)
    : accounts_{accounts} {}

void transfer_engine::transfer(accountstore::registry::context_t& context,
                               const std::string& sender_id,
                               const std::string& recipient_id,
                               accountstore::schema::balance_t amount) const {
  // Two writes to one key in a context collapse into the last one, which
  // would silently drop the debit.
  if (sender_id == recipient_id) {
    throw error{error_code::same_account,
                "sender and recipient are the same account: " + sender_id};
  }

  auto sender = accounts_.read(context, sender_id);
  auto recipient = accounts_.read(context, recipient_id);

  if (sender.currency != recipient.currency) {
    throw error{error_code::currency_mismatch,
                "currency mismatch " + sender.currency +
                    " != " + recipient.currency};
  }

  sender.balance = wrapping_sub(sender.balance, amount);
  recipient.balance = wrapping_add(recipient.balance, amount);

  spdlog::info("sender balance = {}, recipient balance = {}", sender.balance,
               recipient.balance);

  accounts_.store(context, sender);
  accounts_.store(context, recipient);
}

}  // namespace accountstore::execution
