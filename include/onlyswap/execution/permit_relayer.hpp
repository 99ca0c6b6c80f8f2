#pragma once

#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/schema/permit.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <onlyswap/schema/transaction_result.hpp>
#include <cstdint>
#include <string_view>

namespace onlyswap::execution {

inline constexpr std::string_view kPermitDomainTag{"permit2-v1"};

/// Value transfer authorized by the owner's signature instead of a prior
/// call from the owner.
class permit_relayer {
 public:
  virtual ~permit_relayer() = default;

  /// Move `amount` of `permit.token` from `owner` to `to`. The owner's
  /// signature covers the permit, the spender (`context.caller`) and
  /// `witness`, so the spender cannot alter what the owner attested to.
  virtual onlyswap::schema::transaction_result_t permit_witness_transfer_from(
      ledger& ledger,
      const call_context& context,
      const onlyswap::schema::account_id_t& owner,
      const onlyswap::schema::permit_transfer_t& permit,
      const onlyswap::schema::account_id_t& to,
      const onlyswap::schema::amount_t& amount,
      const onlyswap::schema::hash32_t& witness,
      const onlyswap::schema::permit_signature_t& signature) = 0;
};

/// Permit relayer checking signatures of the owning key.
///
/// Owners approve the relayer once on the token ledger; every permit then
/// spends from that allowance. Nonces are single use per owner.
class signature_permit_relayer final : public permit_relayer {
 public:
  explicit signature_permit_relayer(onlyswap::schema::account_id_t address);

  const onlyswap::schema::account_id_t& address() const;

  /// Message an owner signs to let `spender` use `permit` bound to `witness`.
  onlyswap::schema::bytes_t permit_message(
      onlyswap::schema::chain_id_t chain_id,
      const onlyswap::schema::account_id_t& spender,
      const onlyswap::schema::permit_transfer_t& permit,
      const onlyswap::schema::hash32_t& witness) const;

  onlyswap::schema::hash32_t permit_digest(
      onlyswap::schema::chain_id_t chain_id,
      const onlyswap::schema::account_id_t& spender,
      const onlyswap::schema::permit_transfer_t& permit,
      const onlyswap::schema::hash32_t& witness) const;

  bool is_nonce_used(const ledger& ledger,
                     const onlyswap::schema::account_id_t& owner,
                     uint64_t nonce) const;

  onlyswap::schema::transaction_result_t permit_witness_transfer_from(
      ledger& ledger,
      const call_context& context,
      const onlyswap::schema::account_id_t& owner,
      const onlyswap::schema::permit_transfer_t& permit,
      const onlyswap::schema::account_id_t& to,
      const onlyswap::schema::amount_t& amount,
      const onlyswap::schema::hash32_t& witness,
      const onlyswap::schema::permit_signature_t& signature) override;

 private:
  onlyswap::schema::account_id_t address_;
};

}  // namespace onlyswap::execution
