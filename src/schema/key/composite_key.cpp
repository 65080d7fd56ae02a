#include <accountstore/common/error.hpp>
#include <accountstore/schema/key/builder.hpp>
#include <accountstore/schema/key/composite_key.hpp>

namespace accountstore::schema::key {

std::string make_composite_key(const std::string_view& name,
                               const std::vector<std::string>& components) {
  auto b = builder{};
  b.data.push_back(kCompositeKeyDelimiter);
  b.segment(name);
  for (const auto& component : components) {
    b.segment(component);
  }
  return make_string(b.data);
}

composite_key_parts_t split_composite_key(const std::string_view& key) {
  if (!is_composite_key(key) || key.back() != '\0') {
    throw accountstore::common::error{
        accountstore::schema::error_code::invalid_argument,
        "not a composite key"};
  }

  auto parts = std::vector<std::string>{};
  auto begin = size_t{1};
  while (begin < key.size()) {
    auto end = key.find('\0', begin);
    parts.emplace_back(key.substr(begin, end - begin));
    begin = end + 1;
  }

  auto name = std::move(parts.front());
  parts.erase(std::begin(parts));
  return {std::move(name), std::move(parts)};
}

bool is_composite_key(const std::string_view& key) {
  return key.size() > 1 &&
         static_cast<uint8_t>(key.front()) == kCompositeKeyDelimiter;
}

}  // namespace accountstore::schema::key
