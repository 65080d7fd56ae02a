#pragma once

#include <accountstore/registry/secondary_index.hpp>
#include <accountstore/schema/primitives.hpp>
#include <accountstore/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

namespace accountstore::testing {

using storage_t =
    accountstore::storage::storage<accountstore::storage::rocksdb_storage_tag>;

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" + std::to_string(::getpid()) + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary directory removed when the owner goes out of scope.
class scoped_path final {
 public:
  explicit scoped_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  ~scoped_path() { remove_path(path_); }

  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

/// Fresh RocksDB ledger plus encoder for tests that drive the registries
/// directly through a ledger context.
class ledger_fixture final {
 public:
  explicit ledger_fixture(const std::string_view db_prefix)
      : path_{db_prefix},
        storage_{accountstore::storage::make_storage<
            accountstore::storage::rocksdb_storage_tag>(path_.path())} {}

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;

  accountstore::registry::encoder_t& encoder() { return encoder_; }
  storage_t& storage() { return storage_; }

  accountstore::registry::context_t begin(const std::string& tx_id) {
    return storage_.begin(tx_id, ++clock_);
  }

 private:
  // Declared first so the directory outlives the open database.
  scoped_path path_;
  accountstore::registry::encoder_t encoder_{};
  storage_t storage_;
  accountstore::schema::timestamp_milliseconds_t clock_{1'700'000'000'000};
};

}  // namespace accountstore::testing
