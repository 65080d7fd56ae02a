#pragma once

#include <accountstore/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: account.
// Balance record keyed by account id. `email` references a participant but is
// not checked for existence.
namespace accountstore::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  std::string id;
  std::string currency;
  balance_t balance{};
  std::string email;

  bool operator==(const account&) const = default;
};

using account_t = account<1>;

}  // namespace accountstore::schema
