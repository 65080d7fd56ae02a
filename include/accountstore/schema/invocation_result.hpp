#pragma once

#include <accountstore/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: invocation result.
// Response envelope: code 0 with a SCALE payload on success, otherwise the
// numeric error code with its name and message.
namespace accountstore::schema {

template <uint16_t Version>
struct invocation_result;

template <>
struct invocation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t payload;
  std::string tx_id;
  std::string codespace;
};

using invocation_result_t = invocation_result<1>;

}  // namespace accountstore::schema
