#pragma once

#include <accountstore/registry/account_registry.hpp>
#include <accountstore/schema/primitives.hpp>
#include <string>

namespace accountstore::execution {

/// Moves balance between two accounts of the same currency.
///
/// Neither the sign of the amount nor the sender's resulting balance is
/// checked. Both accounts are written to the same context, so the pair is
/// applied or discarded together. Replaying a transfer applies it again.
class transfer_engine final {
 public:
  explicit transfer_engine(
      const accountstore::registry::account_registry& accounts);

  /// Throws `same_account`, `not_found`, `corrupt` or `currency_mismatch`.
  void transfer(accountstore::registry::context_t& context,
                const std::string& sender_id,
                const std::string& recipient_id,
                accountstore::schema::balance_t amount) const;

 private:
  const accountstore::registry::account_registry& accounts_;
};

}  // namespace accountstore::execution
