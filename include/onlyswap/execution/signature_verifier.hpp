#pragma once

#include <onlyswap/schema/primitives.hpp>
#include <string>
#include <string_view>

namespace onlyswap::execution {

inline constexpr std::string_view kSwapRequestDomainTag{"swap-v1"};
inline constexpr std::string_view kContractUpgradeDomainTag{"upgrade-v1"};

/// Quorum authorization oracle for one application domain.
///
/// A signature is valid only for the digest of (domain tag, message), so a
/// signature produced for one domain never verifies in another.
class signature_verifier {
 public:
  virtual ~signature_verifier() = default;

  virtual std::string_view domain_tag() const = 0;

  virtual bool verify(const onlyswap::schema::bytes_view_t& message,
                      const onlyswap::schema::bytes_view_t& signature) const = 0;

  /// Digest the quorum signs for `message` in this verifier's domain.
  onlyswap::schema::hash32_t message_digest(
      const onlyswap::schema::bytes_view_t& message) const;
};

/// Digest of `message` under `domain_tag`.
onlyswap::schema::hash32_t make_domain_digest(
    std::string_view domain_tag,
    const onlyswap::schema::bytes_view_t& message);

/// Verifies ed25519 signatures made with a threshold committee's group key.
class ed25519_group_verifier final : public signature_verifier {
 public:
  ed25519_group_verifier(std::string domain_tag,
                         onlyswap::schema::ed25519_signer_id group_key);

  std::string_view domain_tag() const override;

  bool verify(const onlyswap::schema::bytes_view_t& message,
              const onlyswap::schema::bytes_view_t& signature) const override;

  const onlyswap::schema::ed25519_signer_id& group_key() const;

 private:
  std::string domain_tag_;
  onlyswap::schema::ed25519_signer_id group_key_;
};

}  // namespace onlyswap::execution
