#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace accountstore::common {

inline constexpr auto kLogLevelMappings = std::array{
    std::pair<std::string_view, spdlog::level::level_enum>{
        "trace", spdlog::level::trace},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "debug", spdlog::level::debug},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "info", spdlog::level::info},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "warn", spdlog::level::warn},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "error", spdlog::level::err},
    std::pair<std::string_view, spdlog::level::level_enum>{
        "critical", spdlog::level::critical}};

/// Level named by value, or std::nullopt for anything outside the table.
/// Unlike spdlog::level::from_str, unknown names never turn logging off.
inline std::optional<spdlog::level::level_enum> try_log_level_from_string(
    const std::string_view value) {
  for (const auto& [name, level] : kLogLevelMappings) {
    if (name == value) {
      return level;
    }
  }
  return std::nullopt;
}

}  // namespace accountstore::common
