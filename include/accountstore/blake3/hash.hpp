#pragma once
#include <accountstore/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace accountstore::blake3 {

accountstore::schema::hash32_t hash(const std::string_view& str);
accountstore::schema::hash32_t hash(
    const accountstore::schema::bytes_view_t& bytes);

/// Lower-case hex of the BLAKE3 digest of str.
std::string hex_digest(const std::string_view& str);

}  // namespace accountstore::blake3
