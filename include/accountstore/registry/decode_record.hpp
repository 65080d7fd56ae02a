#pragma once

#include <accountstore/registry/secondary_index.hpp>
#include <optional>

namespace accountstore::registry {

inline constexpr uint16_t kRecordVersion{1};

/// Decode a stored record, accepting only the current schema version and
/// values that are consumed exactly. Records of another kind stored under the
/// same key decode with leftover or missing bytes and are rejected.
template <typename Record>
std::optional<Record> try_decode_record(
    encoder_t& encoder,
    const accountstore::schema::bytes_view_t& bytes) {
  auto record = encoder.try_decode<Record>(bytes);
  if (!record || record->version != kRecordVersion) {
    return std::nullopt;
  }
  if (encoder.encode(*record).size() != bytes.size()) {
    return std::nullopt;
  }
  return record;
}

}  // namespace accountstore::registry
