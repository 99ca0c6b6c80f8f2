#include <onlyswap/blake3/hash.hpp>

namespace onlyswap::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

onlyswap::schema::hash32_t hasher::finalize() const {
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<onlyswap::schema::hash32_t>);
  auto output = onlyswap::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

onlyswap::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

onlyswap::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace onlyswap::blake3
