#pragma once

#include <accountstore/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: invocation.
// Named function call with positional string arguments, as delivered by the
// host to the execution engine.
namespace accountstore::schema {

template <uint16_t Version>
struct invocation;

template <>
struct invocation<1> final {
  uint16_t version{1};
  std::string function;
  std::vector<std::string> args;
  std::string tx_id;
};

using invocation_t = invocation<1>;

}  // namespace accountstore::schema
