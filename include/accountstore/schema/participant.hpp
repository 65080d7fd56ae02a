#pragma once

#include <accountstore/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Schema type: participant.
// Identity record keyed by email. Written once, never updated.
namespace accountstore::schema {

inline constexpr std::string_view kParticipantDocType{"participant"};

template <uint16_t Version>
struct participant;

template <>
struct participant<1> final {
  uint16_t version{1};
  std::string doc_type{kParticipantDocType};
  std::string email;
  std::string name;
  std::string surname;
  std::string phone;
  std::string password_digest;

  bool operator==(const participant&) const = default;
};

using participant_t = participant<1>;

}  // namespace accountstore::schema
