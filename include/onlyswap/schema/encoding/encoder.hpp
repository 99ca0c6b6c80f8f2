#pragma once
#include <onlyswap/schema/primitives.hpp>
#include <optional>
#include <span>

namespace onlyswap::schema::encoding {

// The codec is a build time choice selected by tag. Everything that is
// hashed, signed or persisted goes through the same encoder so both ledgers
// derive identical bytes from identical values.
template <typename Library>
struct encoder {
  template <typename T>
  onlyswap::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, onlyswap::schema::bytes_t& out);

  template <typename T>
  T decode(const onlyswap::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const onlyswap::schema::bytes_view_t& bytes);
};

}  // namespace onlyswap::schema::encoding
