#pragma once
#include <accountstore/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace accountstore::schema::key {

/// Separator between composite key components. Also the first byte of every
/// composite key, which keeps them apart from simple keys.
inline constexpr uint8_t kCompositeKeyDelimiter{0x00};

struct builder final {
  accountstore::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// Append a composite key component and its terminating delimiter.
  /// Throws `invalid_argument` when the component contains the delimiter.
  builder& segment(const std::string_view& str);

  // Big-endian so that byte order of the key follows numeric order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = sizeof(T); i > 0; --i) {
      data.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace accountstore::schema::key
