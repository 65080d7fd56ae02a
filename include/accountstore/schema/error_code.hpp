#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: error code.
// Ledger failure taxonomy: stable numeric codes returned to invokers.
namespace accountstore::schema {

enum class error_code : uint32_t {
  storage_unavailable = 1,
  not_found = 2,
  already_exists = 3,
  corrupt = 4,
  currency_mismatch = 5,
  same_account = 6,
  invalid_argument = 7,
  unknown_function = 8,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"storage_unavailable",
                                            error_code::storage_unavailable},
    std::pair<std::string_view, error_code>{"not_found",
                                            error_code::not_found},
    std::pair<std::string_view, error_code>{"already_exists",
                                            error_code::already_exists},
    std::pair<std::string_view, error_code>{"corrupt", error_code::corrupt},
    std::pair<std::string_view, error_code>{"currency_mismatch",
                                            error_code::currency_mismatch},
    std::pair<std::string_view, error_code>{"same_account",
                                            error_code::same_account},
    std::pair<std::string_view, error_code>{"invalid_argument",
                                            error_code::invalid_argument},
    std::pair<std::string_view, error_code>{"unknown_function",
                                            error_code::unknown_function}};

inline constexpr std::optional<error_code> try_error_code_from_string(
    const std::string_view value) {
  for (const auto& [name, code] : kErrorCodeMappings) {
    if (name == value) {
      return code;
    }
  }
  return std::nullopt;
}

inline constexpr std::string_view to_string(const error_code value) {
  for (const auto& [name, code] : kErrorCodeMappings) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace accountstore::schema
