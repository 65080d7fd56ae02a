#pragma once

#include <accountstore/schema/encoding/scale/encoder.hpp>
#include <accountstore/storage/rocksdb/storage.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace accountstore::registry {

using context_t = accountstore::storage::ledger_context<
    accountstore::storage::rocksdb_storage_tag>;
using state_iterator_t = accountstore::storage::state_iterator<
    accountstore::storage::rocksdb_storage_tag>;
using encoder_t = accountstore::schema::encoding::encoder<
    accountstore::schema::encoding::scale_encoder_tag>;

/// Participants by document type: (doc_type, email).
inline constexpr std::string_view kDocTypeIndex{"doc~type"};
/// Accounts by owner: (email, account id).
inline constexpr std::string_view kAccountEmailIndex{"account~email"};

/// Value stored under every index entry; the key carries all information.
inline const accountstore::schema::bytes_t kIndexSentinel{0x00};

/// Primary keys share the ledger with index entries; reject keys that would
/// land in the composite keyspace. Throws `invalid_argument`.
void require_primary_key(const std::string& key, std::string_view what);

/// Derived lookup on top of the primary-key ledger.
///
/// Entries are composite keys `(name, components...)` whose last component
/// is the primary key of the indexed record. They are written in the same
/// context as the primary record and never updated or removed on their own.
class secondary_index final {
 public:
  explicit secondary_index(std::string_view name);

  void insert(context_t& context,
              const std::vector<std::string>& components) const;

  /// Entries whose leading components equal prefix, in key byte order.
  state_iterator_t scan_by_prefix(
      context_t& context,
      const std::vector<std::string>& prefix) const;

  const std::string& name() const;

 private:
  std::string name_;
};

}  // namespace accountstore::registry
