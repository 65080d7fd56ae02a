#include <spdlog/spdlog.h>
#include <accountstore/common/error.hpp>
#include <accountstore/registry/secondary_index.hpp>
#include <accountstore/schema/key/builder.hpp>

namespace accountstore::registry {

void require_primary_key(const std::string& key, std::string_view what) {
  if (key.empty() || static_cast<uint8_t>(key.front()) ==
                          accountstore::schema::key::kCompositeKeyDelimiter) {
    throw accountstore::common::error{
        accountstore::schema::error_code::invalid_argument,
        std::string{what} + " must be a non-empty simple key"};
  }
}

secondary_index::secondary_index(std::string_view name) : name_{name} {}

void secondary_index::insert(
    context_t& context,
    const std::vector<std::string>& components) const {
  auto key = context.make_composite_key(name_, components);
  context.put(key, kIndexSentinel);
  spdlog::debug("Indexed {} entry with {} component(s)", name_,
                components.size());
}

state_iterator_t secondary_index::scan_by_prefix(
    context_t& context,
    const std::vector<std::string>& prefix) const {
  return context.scan_by_composite_prefix(name_, prefix);
}

const std::string& secondary_index::name() const {
  return name_;
}

}  // namespace accountstore::registry
