#include <spdlog/spdlog.h>
#include <accountstore/common/critical.hpp>
#include <accountstore/common/error.hpp>
#include <accountstore/schema/key/ledger_keys.hpp>
#include <accountstore/storage/rocksdb/storage.hpp>
#include <utility>

using accountstore::common::error;
using accountstore::schema::error_code;

namespace accountstore::storage {

namespace {

[[noreturn]] void throw_unavailable(const std::string_view& what,
                                    const ROCKSDB_NAMESPACE::Status& status) {
  spdlog::error("{}: {}", what, status.ToString());
  throw error{error_code::storage_unavailable,
              std::string{what} + ": " + status.ToString()};
}

// Simple keys may be any non-empty string that does not start with the
// composite key delimiter; keys that do must be well-formed composite keys.
void validate_key(const std::string_view& key) {
  if (key.empty()) {
    throw error{error_code::invalid_argument, "ledger key must not be empty"};
  }
  if (static_cast<uint8_t>(key.front()) ==
      accountstore::schema::key::kCompositeKeyDelimiter) {
    accountstore::schema::key::split_composite_key(key);
  }
}

bool starts_with(const ROCKSDB_NAMESPACE::Slice& key,
                 const std::string& prefix) {
  return std::string_view{key.data(), key.size()}.starts_with(prefix);
}

}  // namespace

state_iterator<rocksdb_storage_tag>::state_iterator(
    std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator,
    std::string prefix)
    : iterator_{std::move(iterator)}, prefix_{std::move(prefix)} {
  iterator_->Seek(prefix_);
}

bool state_iterator<rocksdb_storage_tag>::has_next() {
  if (!iterator_->status().ok()) {
    throw_unavailable("Failed scanning ledger state", iterator_->status());
  }
  return iterator_->Valid() && starts_with(iterator_->key(), prefix_);
}

key_value_entry_t state_iterator<rocksdb_storage_tag>::next() {
  if (!has_next()) {
    accountstore::common::critical("state_iterator::next past the end");
  }
  auto key = iterator_->key();
  key.remove_prefix(accountstore::schema::key::kStatePrefix.size());
  auto entry = key_value_entry_t{key.ToString(),
                                 detail::to_bytes(iterator_->value())};
  iterator_->Next();
  return entry;
}

history_iterator<rocksdb_storage_tag>::history_iterator(
    std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator,
    std::string prefix)
    : iterator_{std::move(iterator)}, prefix_{std::move(prefix)} {
  iterator_->Seek(prefix_);
}

bool history_iterator<rocksdb_storage_tag>::has_next() {
  if (!iterator_->status().ok()) {
    throw_unavailable("Failed reading ledger history", iterator_->status());
  }
  return iterator_->Valid() && starts_with(iterator_->key(), prefix_);
}

history_record history_iterator<rocksdb_storage_tag>::next() {
  if (!has_next()) {
    accountstore::common::critical("history_iterator::next past the end");
  }
  auto raw = detail::to_bytes(iterator_->value());
  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<detail::history_row_t>(
      accountstore::schema::bytes_view_t{raw.data(), raw.size()});
  if (!decoded.has_value()) {
    throw error{error_code::corrupt, "undecodable ledger history row"};
  }
  iterator_->Next();

  auto& [tx_id, timestamp, is_delete, value] = decoded.value();
  return history_record{.tx_id = std::move(tx_id),
                        .timestamp = timestamp,
                        .value = std::move(value),
                        .is_delete = is_delete};
}

ledger_context<rocksdb_storage_tag>::ledger_context(
    storage<rocksdb_storage_tag>& storage,
    std::string tx_id,
    accountstore::schema::timestamp_milliseconds_t timestamp)
    : storage_{storage}, tx_id_{std::move(tx_id)}, timestamp_{timestamp} {
  if (!storage_.database) {
    accountstore::common::critical("RocksDB database is not initialized");
  }
  snapshot_ = storage_.database->GetSnapshot();
}

ledger_context<rocksdb_storage_tag>::~ledger_context() {
  if (!committed_ && !writes_.empty()) {
    spdlog::debug("Discarding {} buffered write(s) of tx '{}'", writes_.size(),
                  tx_id_);
  }
  storage_.database->ReleaseSnapshot(snapshot_);
}

ROCKSDB_NAMESPACE::ReadOptions
ledger_context<rocksdb_storage_tag>::read_options() const {
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  options.snapshot = snapshot_;
  return options;
}

std::optional<accountstore::schema::bytes_t>
ledger_context<rocksdb_storage_tag>::get(const std::string_view& key) {
  validate_key(key);
  auto value = std::string{};
  auto status = storage_.database->Get(
      read_options(), accountstore::schema::key::make_state_key(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    throw_unavailable("Failed to get value from RocksDB", status);
  }
  return accountstore::schema::make_bytes(value);
}

void ledger_context<rocksdb_storage_tag>::put(
    const std::string_view& key,
    const accountstore::schema::bytes_t& value) {
  validate_key(key);
  if (value.empty()) {
    writes_.insert_or_assign(std::string{key}, std::nullopt);
    return;
  }
  writes_.insert_or_assign(std::string{key}, value);
}

void ledger_context<rocksdb_storage_tag>::remove(const std::string_view& key) {
  validate_key(key);
  writes_.insert_or_assign(std::string{key}, std::nullopt);
}

std::string ledger_context<rocksdb_storage_tag>::make_composite_key(
    const std::string_view& name,
    const std::vector<std::string>& components) {
  return accountstore::schema::key::make_composite_key(name, components);
}

accountstore::schema::key::composite_key_parts_t
ledger_context<rocksdb_storage_tag>::split_composite_key(
    const std::string_view& key) {
  return accountstore::schema::key::split_composite_key(key);
}

state_iterator<rocksdb_storage_tag>
ledger_context<rocksdb_storage_tag>::scan_by_composite_prefix(
    const std::string_view& name,
    const std::vector<std::string>& prefix) {
  auto prefix_key = accountstore::schema::key::make_state_key(
      make_composite_key(name, prefix));
  return state_iterator<rocksdb_storage_tag>{
      std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
          storage_.database->NewIterator(read_options())},
      std::move(prefix_key)};
}

history_iterator<rocksdb_storage_tag>
ledger_context<rocksdb_storage_tag>::history_of(const std::string_view& key) {
  validate_key(key);
  auto encoder = detail::encoder_t{};
  auto prefix = accountstore::schema::key::make_history_prefix(encoder, key);
  return history_iterator<rocksdb_storage_tag>{
      std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
          storage_.database->NewIterator(read_options())},
      std::move(prefix)};
}

const std::string& ledger_context<rocksdb_storage_tag>::tx_id() const {
  return tx_id_;
}

accountstore::schema::timestamp_milliseconds_t
ledger_context<rocksdb_storage_tag>::timestamp() const {
  return timestamp_;
}

void ledger_context<rocksdb_storage_tag>::commit() {
  if (committed_) {
    accountstore::common::critical("ledger context committed twice");
  }
  if (writes_.empty()) {
    committed_ = true;
    return;
  }

  auto encoder = detail::encoder_t{};
  auto sequence = storage_.commit_sequence + 1;
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  for (const auto& [key, value] : writes_) {
    auto state_key = accountstore::schema::key::make_state_key(key);
    auto status = value.has_value()
                      ? batch.Put(state_key, detail::to_slice(*value))
                      : batch.Delete(state_key);
    if (!status.ok()) {
      throw_unavailable("Failed staging ledger write", status);
    }

    auto row = encoder.encode(detail::history_row_t{
        tx_id_, timestamp_, !value.has_value(),
        value.value_or(accountstore::schema::bytes_t{})});
    status = batch.Put(
        accountstore::schema::key::make_history_key(encoder, key, sequence),
        detail::to_slice(row));
    if (!status.ok()) {
      throw_unavailable("Failed staging ledger history", status);
    }
  }

  auto encoded_sequence = encoder.encode(sequence);
  auto status =
      batch.Put(std::string{accountstore::schema::key::kCommitSequenceKey},
                detail::to_slice(encoded_sequence));
  if (!status.ok()) {
    throw_unavailable("Failed staging commit sequence", status);
  }

  status = storage_.database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    throw_unavailable("Failed to commit ledger transaction", status);
  }

  storage_.commit_sequence = sequence;
  committed_ = true;
  spdlog::debug("Committed tx '{}' at sequence {} with {} write(s)", tx_id_,
                sequence, writes_.size());
}

ledger_context<rocksdb_storage_tag> storage<rocksdb_storage_tag>::begin(
    std::string tx_id,
    accountstore::schema::timestamp_milliseconds_t timestamp) {
  return ledger_context<rocksdb_storage_tag>{*this, std::move(tx_id),
                                             timestamp};
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    accountstore::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  auto raw_sequence = std::string{};
  status = store.database->Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      std::string{accountstore::schema::key::kCommitSequenceKey},
      &raw_sequence);
  if (status.ok()) {
    auto encoder = detail::encoder_t{};
    auto decoded = encoder.try_decode<uint64_t>(
        accountstore::schema::make_bytes_view(raw_sequence));
    if (!decoded.has_value()) {
      accountstore::common::critical("failed to decode commit sequence");
    }
    store.commit_sequence = decoded.value();
  } else if (!status.IsNotFound()) {
    spdlog::error("Failed to load commit sequence: {}", status.ToString());
    accountstore::common::critical("Failed to load commit sequence");
  }
  spdlog::info("Ledger at commit sequence {}", store.commit_sequence);

  return store;
}

}  // namespace accountstore::storage
