#pragma once
#include <accountstore/schema/key/composite_key.hpp>
#include <accountstore/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace accountstore::storage {

using key_value_entry_t = std::pair<std::string, accountstore::schema::bytes_t>;

/// One version of a ledger key as kept by the history log.
struct history_record final {
  std::string tx_id;
  accountstore::schema::timestamp_milliseconds_t timestamp{};
  accountstore::schema::bytes_t value;
  bool is_delete{};
};

/// Forward-only cursor over world-state rows matching a composite key prefix.
/// Releases the underlying scan handle when destroyed.
template <typename Library>
class state_iterator {
 public:
  bool has_next();
  key_value_entry_t next();
};

/// Forward-only cursor over the versions of one key, oldest first.
template <typename Library>
class history_iterator {
 public:
  bool has_next();
  history_record next();
};

/// Transaction context: the only way the registries reach the ledger.
///
/// Reads observe the state committed before the context was opened; writes
/// are buffered and become visible together on `commit()`. A context that is
/// destroyed without committing discards its writes. Backend faults raise
/// `error_code::storage_unavailable`.
template <typename Library>
class ledger_context {
 public:
  /// Committed value at key, or std::nullopt when the key is absent.
  std::optional<accountstore::schema::bytes_t> get(
      const std::string_view& key);

  /// Buffer a write of value at key. An empty value is recorded as a delete.
  void put(const std::string_view& key,
           const accountstore::schema::bytes_t& value);

  /// Buffer a delete of key; its history gains a tombstone on commit.
  void remove(const std::string_view& key);

  std::string make_composite_key(const std::string_view& name,
                                 const std::vector<std::string>& components);

  accountstore::schema::key::composite_key_parts_t split_composite_key(
      const std::string_view& key);

  /// Committed rows whose composite key starts with (name, prefix...), in key
  /// byte order.
  state_iterator<Library> scan_by_composite_prefix(
      const std::string_view& name,
      const std::vector<std::string>& prefix);

  /// Committed versions of key, oldest first.
  history_iterator<Library> history_of(const std::string_view& key);

  const std::string& tx_id() const;
  accountstore::schema::timestamp_milliseconds_t timestamp() const;

  /// Apply all buffered writes atomically and append one history version per
  /// written key.
  void commit();
};

template <typename Library>
struct storage {
  /// Open a transaction context over the current committed state.
  ledger_context<Library> begin(
      std::string tx_id,
      accountstore::schema::timestamp_milliseconds_t timestamp);
};

/// Construct a concrete ledger backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace accountstore::storage
