#pragma once

#include <onlyswap/execution/world_state.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <cstdint>
#include <string_view>
#include <vector>

namespace onlyswap::execution {

/// Order-preserving set of 32-byte values stored in the world state.
///
/// Layout: a length entry, `index -> value` items and `value -> index + 1`
/// positions. Removal moves the last item into the vacated slot, so all
/// operations are O(1) and enumeration order is only stable until a removal.
class enumerable_set final {
 public:
  enumerable_set(world_state& state, const onlyswap::schema::hash32_t& set_id);

  /// Set id for a named set owned by `owner`, optionally qualified.
  static onlyswap::schema::hash32_t make_set_id(
      world_state& state,
      const onlyswap::schema::account_id_t& owner,
      std::string_view name,
      const onlyswap::schema::bytes_t& qualifier = {});

  bool contains(const onlyswap::schema::hash32_t& value) const;
  bool insert(const onlyswap::schema::hash32_t& value);
  bool remove(const onlyswap::schema::hash32_t& value);
  uint64_t size() const;
  std::vector<onlyswap::schema::hash32_t> values() const;

 private:
  world_state& state_;
  onlyswap::schema::hash32_t set_id_;
};

}  // namespace onlyswap::execution
