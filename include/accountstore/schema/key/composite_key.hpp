#pragma once
#include <accountstore/schema/primitives.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Composite keys emulate multi-column lookups on the single-key ledger:
// `0x00 name 0x00 (component 0x00)*`. Keys sharing a leading run of
// components are contiguous in byte order, so a partial key is a scan prefix.
namespace accountstore::schema::key {

using composite_key_parts_t =
    std::pair<std::string, std::vector<std::string>>;

std::string make_composite_key(const std::string_view& name,
                               const std::vector<std::string>& components);

/// Inverse of `make_composite_key`. Throws `invalid_argument` for keys that
/// were not produced by it.
composite_key_parts_t split_composite_key(const std::string_view& key);

bool is_composite_key(const std::string_view& key);

}  // namespace accountstore::schema::key
