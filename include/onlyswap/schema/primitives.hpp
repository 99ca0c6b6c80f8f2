#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace onlyswap::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using token_id_t = hash32_t;
using implementation_id_t = hash32_t;
using chain_id_t = uint64_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

inline constexpr duration_seconds_t kSecondsPerDay = 86400;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Render an amount in base 10.
std::string to_string(const amount_t& amount);
std::optional<amount_t> try_make_amount(std::string_view decimal);

/// Sum of two amounts, or nullopt when it exceeds 2^256 - 1.
std::optional<amount_t> try_add(const amount_t& lhs, const amount_t& rhs);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using signer_id_t = std::variant<ed25519_signer_id, secp256k1_signer_id>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

/// Account controlled by a key: blake3 digest of the raw public key bytes.
account_id_t make_account_id(const signer_id_t& signer);

/// Deterministic account id for named ledger participants (routers,
/// gateways, tokens) derived from a label.
account_id_t make_account_id(std::string_view label);

}  // namespace onlyswap::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
