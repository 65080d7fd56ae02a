#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace accountstore::common {

/// Log and terminate. Reserved for faults the process cannot continue past
/// (ledger cannot be opened, an in-memory value cannot be encoded).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace accountstore::common
