#pragma once

#include <accountstore/schema/account.hpp>
#include <accountstore/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <variant>

// Schema type: history entry.
// One version of an account as recorded by the ledger history log: either a
// decoded snapshot or a tombstone that only remembers which key was deleted.
namespace accountstore::schema {

struct account_snapshot final {
  account_t account;

  bool operator==(const account_snapshot&) const = default;
};

struct account_tombstone final {
  std::string id;

  bool operator==(const account_tombstone&) const = default;
};

using account_record_t = std::variant<account_snapshot, account_tombstone>;

template <uint16_t Version>
struct history_entry;

template <>
struct history_entry<1> final {
  uint16_t version{1};
  account_record_t record;
  std::string tx_id;
  timestamp_milliseconds_t timestamp{};
};

using history_entry_t = history_entry<1>;

inline bool is_delete(const history_entry_t& entry) {
  return std::holds_alternative<account_tombstone>(entry.record);
}

/// Account view of a history record. Tombstones yield an account with only
/// the id populated.
inline account_t materialize(const account_record_t& record) {
  return std::visit(
      overloaded{[](const account_snapshot& snapshot) {
                   return snapshot.account;
                 },
                 [](const account_tombstone& tombstone) {
                   auto placeholder = account_t{};
                   placeholder.id = tombstone.id;
                   return placeholder;
                 }},
      record);
}

}  // namespace accountstore::schema
