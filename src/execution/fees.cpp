#include <onlyswap/execution/fees.hpp>

namespace onlyswap::execution {

fee_split split_verification_fee(const onlyswap::schema::amount_t& amount,
                                 const uint32_t fee_bps) {
  auto wide = boost::multiprecision::uint512_t{amount} * fee_bps;
  auto fee = onlyswap::schema::amount_t{wide / kBpsDenominator};
  return fee_split{.verification_fee = fee,
                   .amount_after_fee = onlyswap::schema::amount_t{amount - fee}};
}

std::optional<onlyswap::schema::amount_t> solver_refund_amount(
    const onlyswap::schema::amount_t& amount_in,
    const onlyswap::schema::amount_t& verification_fee,
    const onlyswap::schema::amount_t& solver_fee) {
  return onlyswap::schema::try_add(
      onlyswap::schema::amount_t{amount_in - verification_fee}, solver_fee);
}

std::optional<onlyswap::schema::transaction_error_code> validate_fee_bps(
    const uint32_t fee_bps,
    const uint32_t max_fee_bps) {
  if (fee_bps == 0) {
    return onlyswap::schema::transaction_error_code::invalid_fee_bps;
  }
  if (fee_bps > max_fee_bps) {
    return onlyswap::schema::transaction_error_code::fee_bps_exceeds_threshold;
  }
  return std::nullopt;
}

}  // namespace onlyswap::execution
