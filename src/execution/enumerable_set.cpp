#include <onlyswap/blake3/hash.hpp>
#include <onlyswap/common/critical.hpp>
#include <onlyswap/execution/enumerable_set.hpp>
#include <onlyswap/schema/key/engine_keys.hpp>
#include <tuple>

namespace onlyswap::execution {

enumerable_set::enumerable_set(world_state& state,
                               const onlyswap::schema::hash32_t& set_id)
    : state_{state}, set_id_{set_id} {}

onlyswap::schema::hash32_t enumerable_set::make_set_id(
    world_state& state,
    const onlyswap::schema::account_id_t& owner,
    const std::string_view name,
    const onlyswap::schema::bytes_t& qualifier) {
  auto encoded = state.encoder().encode(std::tuple{owner, name, qualifier});
  return onlyswap::blake3::hash(
      onlyswap::schema::bytes_view_t{encoded.data(), encoded.size()});
}

bool enumerable_set::contains(const onlyswap::schema::hash32_t& value) const {
  return state_.contains(onlyswap::schema::key::make_set_position_key(
      state_.encoder(), set_id_, value));
}

bool enumerable_set::insert(const onlyswap::schema::hash32_t& value) {
  if (contains(value)) {
    return false;
  }
  auto& encoder = state_.encoder();
  auto length = size();
  state_.put(onlyswap::schema::key::make_set_item_key(encoder, set_id_, length),
             value);
  state_.put(
      onlyswap::schema::key::make_set_position_key(encoder, set_id_, value),
      length + 1);
  state_.put(onlyswap::schema::key::make_set_length_key(encoder, set_id_),
             length + 1);
  return true;
}

bool enumerable_set::remove(const onlyswap::schema::hash32_t& value) {
  auto& encoder = state_.encoder();
  auto position_key =
      onlyswap::schema::key::make_set_position_key(encoder, set_id_, value);
  auto position = state_.get<uint64_t>(position_key);
  if (!position.has_value()) {
    return false;
  }

  auto length = size();
  auto index = *position - 1;
  auto last_index = length - 1;
  if (index != last_index) {
    auto last_key =
        onlyswap::schema::key::make_set_item_key(encoder, set_id_, last_index);
    auto last = state_.get<onlyswap::schema::hash32_t>(last_key);
    if (!last.has_value()) {
      onlyswap::common::critical("enumerable set item missing");
    }
    state_.put(onlyswap::schema::key::make_set_item_key(encoder, set_id_, index),
               *last);
    state_.put(
        onlyswap::schema::key::make_set_position_key(encoder, set_id_, *last),
        index + 1);
  }
  state_.erase(
      onlyswap::schema::key::make_set_item_key(encoder, set_id_, last_index));
  state_.erase(position_key);
  state_.put(onlyswap::schema::key::make_set_length_key(encoder, set_id_),
             last_index);
  return true;
}

uint64_t enumerable_set::size() const {
  return state_.get_or<uint64_t>(
      onlyswap::schema::key::make_set_length_key(state_.encoder(), set_id_), 0);
}

std::vector<onlyswap::schema::hash32_t> enumerable_set::values() const {
  auto length = size();
  auto out = std::vector<onlyswap::schema::hash32_t>{};
  out.reserve(length);
  for (auto index = uint64_t{0}; index < length; ++index) {
    auto value = state_.get<onlyswap::schema::hash32_t>(
        onlyswap::schema::key::make_set_item_key(state_.encoder(), set_id_,
                                                 index));
    if (!value.has_value()) {
      onlyswap::common::critical("enumerable set item missing");
    }
    out.push_back(*value);
  }
  return out;
}

}  // namespace onlyswap::execution
