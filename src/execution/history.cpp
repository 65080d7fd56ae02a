#include <spdlog/spdlog.h>
#include <accountstore/common/error.hpp>
#include <accountstore/execution/history.hpp>
#include <accountstore/registry/decode_record.hpp>
#include <utility>

using accountstore::common::error;
using accountstore::schema::error_code;
using namespace accountstore::schema;

namespace accountstore::execution {

history_cursor::history_cursor(accountstore::registry::encoder_t& encoder,
                               history_iterator_t iterator,
                               std::string account_id)
    : encoder_{encoder},
      iterator_{std::move(iterator)},
      account_id_{std::move(account_id)} {}

bool history_cursor::has_next() {
  return iterator_.has_next();
}

history_entry_t history_cursor::next() {
  auto version = iterator_.next();

  auto entry = history_entry_t{};
  entry.tx_id = std::move(version.tx_id);
  entry.timestamp = version.timestamp;

  if (version.is_delete || version.value.empty()) {
    entry.record = account_tombstone{.id = account_id_};
    return entry;
  }

  auto account = accountstore::registry::try_decode_record<account_t>(
      encoder_, bytes_view_t{version.value.data(), version.value.size()});
  if (!account) {
    throw error{error_code::corrupt,
                "history of account " + account_id_ +
                    " holds an undecodable version in tx " + entry.tx_id};
  }
  entry.record = account_snapshot{.account = std::move(*account)};
  return entry;
}

std::vector<history_entry_t> history_cursor::collect() {
  auto entries = std::vector<history_entry_t>{};
  while (has_next()) {
    entries.push_back(next());
  }
  return entries;
}

history_reconstructor::history_reconstructor(
    accountstore::registry::encoder_t& encoder)
    : encoder_{encoder} {}

history_cursor history_reconstructor::history(
    accountstore::registry::context_t& context,
    const std::string& account_id) const {
  accountstore::registry::require_primary_key(account_id, "account id");
  spdlog::info("Account history: id {}", account_id);
  return history_cursor{encoder_, context.history_of(account_id), account_id};
}

}  // namespace accountstore::execution
