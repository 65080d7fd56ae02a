#include <gtest/gtest.h>
#include <accountstore/common/error.hpp>
#include <accountstore/schema/key/composite_key.hpp>

#include <algorithm>
#include <string>
#include <vector>

using accountstore::schema::key::make_composite_key;
using accountstore::schema::key::split_composite_key;

TEST(composite_key, layout_is_delimiter_separated) {
  auto key = make_composite_key("account~email", {"a@x", "A1"});
  EXPECT_EQ(key, std::string("\0account~email\0a@x\0A1\0", 22));
  EXPECT_TRUE(accountstore::schema::key::is_composite_key(key));
  EXPECT_FALSE(accountstore::schema::key::is_composite_key("A1"));
}

TEST(composite_key, split_returns_name_and_components) {
  auto [name, components] =
      split_composite_key(make_composite_key("doc~type", {"participant", "a@x"}));
  EXPECT_EQ(name, "doc~type");
  EXPECT_EQ(components, (std::vector<std::string>{"participant", "a@x"}));

  auto [bare_name, none] = split_composite_key(make_composite_key("idx", {}));
  EXPECT_EQ(bare_name, "idx");
  EXPECT_TRUE(none.empty());
}

TEST(composite_key, empty_components_survive_split) {
  auto [name, components] =
      split_composite_key(make_composite_key("idx", {"", "b"}));
  EXPECT_EQ(name, "idx");
  EXPECT_EQ(components, (std::vector<std::string>{"", "b"}));
}

TEST(composite_key, partial_key_is_prefix_of_full_key) {
  auto full = make_composite_key("account~email", {"a@x", "A1"});
  auto partial = make_composite_key("account~email", {"a@x"});
  auto other = make_composite_key("account~email", {"a@xy", "A9"});
  EXPECT_TRUE(full.starts_with(partial));
  EXPECT_FALSE(other.starts_with(partial));
}

TEST(composite_key, byte_order_follows_components) {
  auto keys = std::vector<std::string>{
      make_composite_key("account~email", {"b@x", "A1"}),
      make_composite_key("account~email", {"a@x", "A2"}),
      make_composite_key("account~email", {"a@x", "A10"}),
      make_composite_key("account~email", {"a@x", "A1"})};
  std::ranges::sort(keys);
  EXPECT_EQ(split_composite_key(keys[0]).second[1], "A1");
  EXPECT_EQ(split_composite_key(keys[1]).second[1], "A10");
  EXPECT_EQ(split_composite_key(keys[2]).second[1], "A2");
  EXPECT_EQ(split_composite_key(keys[3]).second[0], "b@x");
}

TEST(composite_key, rejects_delimiter_inside_component) {
  try {
    make_composite_key("idx", {std::string("a\0b", 3)});
    FAIL() << "expected invalid_argument";
  } catch (const accountstore::common::error& e) {
    EXPECT_EQ(e.code(), accountstore::schema::error_code::invalid_argument);
  }
}

TEST(composite_key, split_rejects_simple_keys) {
  EXPECT_THROW(split_composite_key("A1"), accountstore::common::error);
  EXPECT_THROW(split_composite_key(std::string("\0idx", 4)),
               accountstore::common::error);
}
