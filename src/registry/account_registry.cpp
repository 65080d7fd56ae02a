#include <spdlog/spdlog.h>
#include <accountstore/common/error.hpp>
#include <accountstore/registry/account_registry.hpp>
#include <accountstore/registry/decode_record.hpp>

using accountstore::common::error;
using accountstore::schema::account_t;
using accountstore::schema::error_code;

namespace accountstore::registry {

account_registry::account_registry(encoder_t& encoder)
    : encoder_{encoder}, account_email_index_{kAccountEmailIndex} {}

bool account_registry::exists(context_t& context, const std::string& id) const {
  require_primary_key(id, "account id");
  return context.get(id).has_value();
}

void account_registry::create(context_t& context,
                              const std::string& id,
                              const std::string& currency,
                              accountstore::schema::balance_t balance,
                              const std::string& email) const {
  spdlog::info("Creating account {} ({} {}) for {}", id, balance, currency,
               email);
  require_primary_key(id, "account id");
  if (exists(context, id)) {
    throw error{error_code::already_exists, "account already exists: " + id};
  }

  auto account = account_t{};
  account.id = id;
  account.currency = currency;
  account.balance = balance;
  account.email = email;

  store(context, account);
  account_email_index_.insert(context, {account.email, account.id});
}

account_t account_registry::read(context_t& context,
                                 const std::string& id) const {
  require_primary_key(id, "account id");
  auto stored = context.get(id);
  if (!stored) {
    throw error{error_code::not_found, "account " + id + " does not exist"};
  }
  auto account = try_decode_record<account_t>(
      encoder_,
      accountstore::schema::bytes_view_t{stored->data(), stored->size()});
  if (!account) {
    throw error{error_code::corrupt,
                "account " + id + " is not a valid record"};
  }
  return *account;
}

void account_registry::store(context_t& context,
                             const account_t& account) const {
  context.put(account.id, encoder_.encode(account));
}

record_cursor<account_t> account_registry::list_for_participant(
    context_t& context,
    const std::string& email) const {
  return record_cursor<account_t>{
      context, account_email_index_.scan_by_prefix(context, {email}), 1,
      [this, &context](const std::string& id) { return read(context, id); }};
}

}  // namespace accountstore::registry
