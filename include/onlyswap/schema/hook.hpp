#pragma once
#include <onlyswap/schema/primitives.hpp>
#include <vector>

// Schema type: hook.
// An external call executed by the hook gateway before request creation
// (pre-hook) or after fulfillment (post-hook).
namespace onlyswap::schema {

template <uint16_t Version>
struct hook;

template <>
struct hook<1> final {
  account_id_t target;
  bytes_t payload;
  uint64_t gas_limit{};
};

using hook_t = hook<1>;
using hooks_t = std::vector<hook_t>;

}  // namespace onlyswap::schema
