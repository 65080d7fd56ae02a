#include <blake3.h>
#include <accountstore/blake3/hash.hpp>

namespace accountstore::blake3 {

accountstore::schema::hash32_t hash(const std::string_view& str) {
  return hash(accountstore::schema::make_bytes_view(str));
}

accountstore::schema::hash32_t hash(
    const accountstore::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = accountstore::schema::hash32_t{};
  static_assert(std::tuple_size_v<accountstore::schema::hash32_t> ==
                BLAKE3_OUT_LEN);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

std::string hex_digest(const std::string_view& str) {
  auto digest = hash(str);
  return accountstore::schema::to_hex(
      accountstore::schema::bytes_view_t{digest.data(), digest.size()});
}

}  // namespace accountstore::blake3
