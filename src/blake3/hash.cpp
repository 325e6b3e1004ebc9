#include <blake3.h>
#include <onft/blake3/hash.hpp>

namespace onft::blake3 {

namespace {

onft::schema::hash32_t hash_raw(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  // BLAKE3_OUT_LEN
  auto output = onft::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

onft::schema::hash32_t hash(const std::string_view& str) {
  return hash_raw(str.data(), str.size());
}

onft::schema::hash32_t hash(const onft::schema::bytes_view_t& bytes) {
  return hash_raw(bytes.data(), bytes.size());
}

}  // namespace onft::blake3
