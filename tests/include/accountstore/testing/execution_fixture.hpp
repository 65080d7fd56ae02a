#pragma once

#include <accountstore/execution/engine.hpp>
#include <accountstore/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace accountstore::testing {

class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix)
      : path_{db_prefix},
        storage_{accountstore::storage::make_storage<
            accountstore::storage::rocksdb_storage_tag>(path_.path())},
        engine_{encoder_, storage_} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;

  accountstore::registry::encoder_t& encoder() { return encoder_; }
  storage_t& storage() { return storage_; }
  accountstore::execution::engine& engine() { return engine_; }

  accountstore::schema::invocation_result_t invoke(
      const std::string& function,
      const std::vector<std::string>& args = {},
      const std::string& tx_id = {}) {
    return engine_.invoke(accountstore::schema::invocation_t{
        .function = function, .args = args, .tx_id = tx_id});
  }

  accountstore::schema::invocation_result_t query(
      const std::string& function,
      const std::vector<std::string>& args = {}) {
    return engine_.query(accountstore::schema::invocation_t{
        .function = function, .args = args});
  }

  template <typename T>
  T decode(const accountstore::schema::invocation_result_t& result) {
    return encoder_.decode<T>(accountstore::schema::bytes_view_t{
        result.payload.data(), result.payload.size()});
  }

 private:
  scoped_path path_;
  accountstore::registry::encoder_t encoder_{};
  storage_t storage_;
  accountstore::execution::engine engine_;
};

}  // namespace accountstore::testing
