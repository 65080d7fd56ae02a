#pragma once
#include <accountstore/schema/primitives.hpp>
#include <optional>
#include <span>

namespace accountstore::schema::encoding {

// The codec is a build-time choice: callers name the library through a tag
// (`encoder<scale_encoder_tag>`) and never touch the library types directly.
template <typename Library>
struct encoder {
  template <typename T>
  accountstore::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, accountstore::schema::bytes_t& out);

  /// Decode or terminate; only for bytes this process produced itself.
  template <typename T>
  T decode(const accountstore::schema::bytes_view_t& bytes);

  /// Decode untrusted bytes (ledger values, wire payloads).
  template <typename T>
  std::optional<T> try_decode(const accountstore::schema::bytes_view_t& bytes);
};

}  // namespace accountstore::schema::encoding
