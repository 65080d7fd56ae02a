#include <spdlog/spdlog.h>
#include <accountstore/blake3/hash.hpp>
#include <accountstore/common/error.hpp>
#include <accountstore/registry/decode_record.hpp>
#include <accountstore/registry/participant_registry.hpp>

using accountstore::common::error;
using accountstore::schema::error_code;
using accountstore::schema::participant_t;

namespace accountstore::registry {

participant_registry::participant_registry(encoder_t& encoder)
    : encoder_{encoder}, doc_type_index_{kDocTypeIndex} {}

bool participant_registry::exists(context_t& context,
                                  const std::string& email) const {
  require_primary_key(email, "participant email");
  return context.get(email).has_value();
}

void participant_registry::create(context_t& context,
                                  const std::string& email,
                                  const std::string& name,
                                  const std::string& surname,
                                  const std::string& phone,
                                  const std::string& secret) const {
  require_primary_key(email, "participant email");
  if (exists(context, email)) {
    throw error{error_code::already_exists,
                "participant already exists: " + email};
  }

  auto participant = participant_t{};
  participant.email = email;
  participant.name = name;
  participant.surname = surname;
  participant.phone = phone;
  participant.password_digest = accountstore::blake3::hex_digest(secret);

  context.put(email, encoder_.encode(participant));
  doc_type_index_.insert(context, {participant.doc_type, participant.email});
  spdlog::info("Created participant {}", email);
}

participant_t participant_registry::read(context_t& context,
                                         const std::string& email) const {
  require_primary_key(email, "participant email");
  auto stored = context.get(email);
  if (!stored) {
    throw error{error_code::not_found,
                "participant " + email + " does not exist"};
  }
  auto participant = try_decode_record<participant_t>(
      encoder_,
      accountstore::schema::bytes_view_t{stored->data(), stored->size()});
  if (!participant ||
      participant->doc_type != accountstore::schema::kParticipantDocType) {
    throw error{error_code::corrupt,
                "participant " + email + " is not a valid record"};
  }
  return *participant;
}

record_cursor<participant_t> participant_registry::list_all(
    context_t& context) const {
  return record_cursor<participant_t>{
      context,
      doc_type_index_.scan_by_prefix(
          context, {std::string{accountstore::schema::kParticipantDocType}}),
      1, [this, &context](const std::string& email) {
        return read(context, email);
      }};
}

}  // namespace accountstore::registry
