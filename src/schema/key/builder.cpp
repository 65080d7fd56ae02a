#include <accountstore/common/error.hpp>
#include <accountstore/schema/key/builder.hpp>
#include <algorithm>
#include <iterator>
#include <ranges>
#include <string>

using namespace accountstore::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::segment(const std::string_view& str) {
  if (str.find(static_cast<char>(kCompositeKeyDelimiter)) !=
      std::string_view::npos) {
    throw accountstore::common::error{
        accountstore::schema::error_code::invalid_argument,
        "composite key component contains the 0x00 delimiter"};
  }
  write(str);
  data.push_back(kCompositeKeyDelimiter);
  return *this;
}
