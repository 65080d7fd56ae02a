#pragma once

#include <accountstore/registry/record_cursor.hpp>
#include <accountstore/registry/secondary_index.hpp>
#include <accountstore/schema/account.hpp>
#include <string>

namespace accountstore::registry {

/// Account records keyed by id, plus the `account~email` index listing the
/// accounts of each participant.
class account_registry final {
 public:
  explicit account_registry(encoder_t& encoder);

  bool exists(context_t& context, const std::string& id) const;

  /// Open an account. The owning participant is not required to exist.
  /// Throws `already_exists` when the id is taken.
  void create(context_t& context,
              const std::string& id,
              const std::string& currency,
              accountstore::schema::balance_t balance,
              const std::string& email) const;

  /// Throws `not_found` or `corrupt`.
  accountstore::schema::account_t read(context_t& context,
                                       const std::string& id) const;

  /// Overwrite an existing account's record. The index is left alone since
  /// id and email never change.
  void store(context_t& context,
             const accountstore::schema::account_t& account) const;

  /// Accounts owned by email, in account id order.
  record_cursor<accountstore::schema::account_t> list_for_participant(
      context_t& context,
      const std::string& email) const;

 private:
  encoder_t& encoder_;
  secondary_index account_email_index_;
};

}  // namespace accountstore::registry
