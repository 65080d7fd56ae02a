#pragma once

#include <accountstore/schema/error_code.hpp>

#include <stdexcept>
#include <string>

namespace accountstore::common {

/// Recoverable operation failure. Raised by the ledger and the registries,
/// caught at the invocation boundary and turned into a result code.
class error final : public std::runtime_error {
 public:
  error(accountstore::schema::error_code code, const std::string& message)
      : std::runtime_error{message}, code_{code} {}

  accountstore::schema::error_code code() const noexcept { return code_; }

 private:
  accountstore::schema::error_code code_;
};

}  // namespace accountstore::common
