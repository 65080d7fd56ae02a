#pragma once

#include <accountstore/schema/key/builder.hpp>
#include <accountstore/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Schema key type: ledger keys.
// Physical layout of the ledger inside the database: world state, per-key
// history log and the commit sequence counter.
namespace accountstore::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|"};
inline constexpr std::string_view kCommitSequenceKey{"SYS|APP|COMMIT_SEQUENCE"};

/// World-state row for a ledger key. The raw key is appended unchanged so that
/// state rows keep the byte order of their ledger keys.
inline std::string make_state_key(const std::string_view& key) {
  auto b = builder{};
  b.write(kStatePrefix);
  b.write(key);
  return make_string(b.data);
}

/// Prefix shared by every history row of `key`. The key is SCALE encoded
/// (length prefixed) so that no key's history prefix is a prefix of another's.
template <typename Encoder>
std::string make_history_prefix(Encoder& encoder, const std::string_view& key) {
  auto b = builder{};
  b.write(kHistoryPrefix);
  auto encoded = encoder.encode(std::string{key});
  b.write(std::span<const uint8_t>{encoded.data(), encoded.size()});
  return make_string(b.data);
}

/// History row for `key` written by commit `sequence`. Rows sort by commit
/// order within the key's prefix.
template <typename Encoder>
std::string make_history_key(Encoder& encoder,
                             const std::string_view& key,
                             uint64_t sequence) {
  auto b = builder{};
  b.data = make_bytes(make_history_prefix(encoder, key));
  b.write(sequence);
  return make_string(b.data);
}

}  // namespace accountstore::schema::key
