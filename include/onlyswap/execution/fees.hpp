#pragma once

#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/transaction_error_code.hpp>
#include <cstdint>
#include <optional>

namespace onlyswap::execution {

inline constexpr uint32_t kBpsDenominator = 10000;
inline constexpr uint32_t kMaxFeeBps = 5000;

struct fee_split final {
  onlyswap::schema::amount_t verification_fee;
  onlyswap::schema::amount_t amount_after_fee;
};

/// floor(amount * fee_bps / 10000) and the remainder. The product is formed
/// in 512 bits so it never wraps.
fee_split split_verification_fee(const onlyswap::schema::amount_t& amount,
                                 uint32_t fee_bps);

/// Amount owed to the solver who repays a request:
/// (amount_in - verification_fee) + solver_fee, or nullopt on overflow.
std::optional<onlyswap::schema::amount_t> solver_refund_amount(
    const onlyswap::schema::amount_t& amount_in,
    const onlyswap::schema::amount_t& verification_fee,
    const onlyswap::schema::amount_t& solver_fee);

std::optional<onlyswap::schema::transaction_error_code> validate_fee_bps(
    uint32_t fee_bps,
    uint32_t max_fee_bps = kMaxFeeBps);

}  // namespace onlyswap::execution
