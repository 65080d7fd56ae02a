#pragma once

#include <accountstore/execution/history.hpp>
#include <accountstore/execution/transfer.hpp>
#include <accountstore/registry/account_registry.hpp>
#include <accountstore/registry/participant_registry.hpp>
#include <accountstore/schema/invocation.hpp>
#include <accountstore/schema/invocation_result.hpp>
#include <accountstore/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace accountstore::execution {

inline constexpr std::string_view kCodespace{"accountstore"};

/// Named-function dispatcher that runs one invocation per ledger context.
///
/// Invocations are serialized. Any error aborts the invocation, discards its
/// context and is reported through the result envelope.
class engine final {
 public:
  engine(accountstore::registry::encoder_t& encoder,
         accountstore::storage::storage<
             accountstore::storage::rocksdb_storage_tag>& storage);

  /// Run the function and commit its writes on success.
  accountstore::schema::invocation_result_t invoke(
      const accountstore::schema::invocation_t& invocation);

  /// Run the function against committed state; writes are always discarded.
  accountstore::schema::invocation_result_t query(
      const accountstore::schema::invocation_t& invocation);

 private:
  using handler_t = std::function<accountstore::schema::bytes_t(
      accountstore::registry::context_t&,
      const std::vector<std::string>&)>;

  accountstore::schema::invocation_result_t run(
      const accountstore::schema::invocation_t& invocation,
      bool commit);
  std::string make_tx_id(const accountstore::schema::invocation_t& invocation);
  void register_functions();

  std::mutex mutex_;
  accountstore::registry::encoder_t& encoder_;
  accountstore::storage::storage<accountstore::storage::rocksdb_storage_tag>&
      storage_;
  accountstore::registry::participant_registry participants_;
  accountstore::registry::account_registry accounts_;
  transfer_engine transfers_;
  history_reconstructor history_;
  std::map<std::string, handler_t, std::less<>> functions_;
  uint64_t invocation_sequence_{};
};

}  // namespace accountstore::execution
