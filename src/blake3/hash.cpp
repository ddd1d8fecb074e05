#include <blake3.h>
#include <strongbox/blake3/hash.hpp>

namespace strongbox::blake3 {

strongbox::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = strongbox::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

strongbox::schema::hash32_t hash(const strongbox::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = strongbox::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

strongbox::schema::hash32_t chain(
    const strongbox::schema::hash32_t& previous,
    const strongbox::schema::bytes_view_t& payload) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, previous.data(), previous.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  auto output = strongbox::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace strongbox::blake3
