#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/write_batch.h>
#include <accountstore/schema/encoding/scale/encoder.hpp>
#include <accountstore/storage/storage.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace accountstore::storage {

namespace detail {

using encoder_t = accountstore::schema::encoding::encoder<
    accountstore::schema::encoding::scale_encoder_tag>;

// Persisted form of a history row: (tx_id, timestamp, is_delete, value).
using history_row_t = std::tuple<std::string,
                                 accountstore::schema::timestamp_milliseconds_t,
                                 bool,
                                 accountstore::schema::bytes_t>;

inline accountstore::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const accountstore::schema::bytes_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag>;

template <>
class state_iterator<rocksdb_storage_tag> final {
 public:
  state_iterator(std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator,
                 std::string prefix);

  bool has_next();
  key_value_entry_t next();

 private:
  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator_;
  std::string prefix_;
};

template <>
class history_iterator<rocksdb_storage_tag> final {
 public:
  history_iterator(std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator,
                   std::string prefix);

  bool has_next();
  history_record next();

 private:
  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator_;
  std::string prefix_;
};

template <>
class ledger_context<rocksdb_storage_tag> final {
 public:
  ledger_context(storage<rocksdb_storage_tag>& storage,
                 std::string tx_id,
                 accountstore::schema::timestamp_milliseconds_t timestamp);
  ~ledger_context();

  ledger_context(const ledger_context&) = delete;
  ledger_context& operator=(const ledger_context&) = delete;
  ledger_context(ledger_context&&) = delete;
  ledger_context& operator=(ledger_context&&) = delete;

  std::optional<accountstore::schema::bytes_t> get(
      const std::string_view& key);
  void put(const std::string_view& key,
           const accountstore::schema::bytes_t& value);
  void remove(const std::string_view& key);

  std::string make_composite_key(const std::string_view& name,
                                 const std::vector<std::string>& components);
  accountstore::schema::key::composite_key_parts_t split_composite_key(
      const std::string_view& key);

  // Iterators read through this context's snapshot and must not outlive it.
  state_iterator<rocksdb_storage_tag> scan_by_composite_prefix(
      const std::string_view& name,
      const std::vector<std::string>& prefix);
  history_iterator<rocksdb_storage_tag> history_of(
      const std::string_view& key);

  const std::string& tx_id() const;
  accountstore::schema::timestamp_milliseconds_t timestamp() const;

  void commit();

 private:
  ROCKSDB_NAMESPACE::ReadOptions read_options() const;

  storage<rocksdb_storage_tag>& storage_;
  const ROCKSDB_NAMESPACE::Snapshot* snapshot_{nullptr};
  std::string tx_id_;
  accountstore::schema::timestamp_milliseconds_t timestamp_{};
  // Last write per key wins; std::nullopt marks a delete.
  std::map<std::string, std::optional<accountstore::schema::bytes_t>> writes_;
  bool committed_{false};
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  uint64_t commit_sequence{};

  ledger_context<rocksdb_storage_tag> begin(
      std::string tx_id,
      accountstore::schema::timestamp_milliseconds_t timestamp);
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace accountstore::storage
