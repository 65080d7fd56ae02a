#pragma once

#include <accountstore/registry/record_cursor.hpp>
#include <accountstore/registry/secondary_index.hpp>
#include <accountstore/schema/participant.hpp>
#include <string>

namespace accountstore::registry {

/// Participant records keyed by email, plus the `doc~type` index that makes
/// them enumerable.
class participant_registry final {
 public:
  explicit participant_registry(encoder_t& encoder);

  bool exists(context_t& context, const std::string& email) const;

  /// Register a participant. Only a BLAKE3 digest of `secret` is stored.
  /// Throws `already_exists` when the email is taken.
  void create(context_t& context,
              const std::string& email,
              const std::string& name,
              const std::string& surname,
              const std::string& phone,
              const std::string& secret) const;

  /// Throws `not_found` or `corrupt`.
  accountstore::schema::participant_t read(context_t& context,
                                           const std::string& email) const;

  /// All participants in email order.
  record_cursor<accountstore::schema::participant_t> list_all(
      context_t& context) const;

 private:
  encoder_t& encoder_;
  secondary_index doc_type_index_;
};

}  // namespace accountstore::registry
