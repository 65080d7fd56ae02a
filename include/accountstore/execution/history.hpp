#pragma once

#include <accountstore/registry/secondary_index.hpp>
#include <accountstore/schema/history_entry.hpp>
#include <string>
#include <vector>

namespace accountstore::execution {

using history_iterator_t = accountstore::storage::history_iterator<
    accountstore::storage::rocksdb_storage_tag>;

/// Single-pass replay of one account's history log, oldest version first.
class history_cursor final {
 public:
  history_cursor(accountstore::registry::encoder_t& encoder,
                 history_iterator_t iterator,
                 std::string account_id);

  bool has_next();

  /// Throws `corrupt` when a non-empty version does not decode as an account.
  accountstore::schema::history_entry_t next();

  /// All versions, or the first error.
  std::vector<accountstore::schema::history_entry_t> collect();

 private:
  accountstore::registry::encoder_t& encoder_;
  history_iterator_t iterator_;
  std::string account_id_;
};

/// Point-in-time account snapshots rebuilt from the ledger history.
class history_reconstructor final {
 public:
  explicit history_reconstructor(accountstore::registry::encoder_t& encoder);

  history_cursor history(accountstore::registry::context_t& context,
                         const std::string& account_id) const;

 private:
  accountstore::registry::encoder_t& encoder_;
};

}  // namespace accountstore::execution
