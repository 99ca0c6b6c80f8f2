#include <onlyswap/crypto/verify.hpp>
#include <onlyswap/execution/messages.hpp>
#include <onlyswap/execution/permit_relayer.hpp>
#include <onlyswap/testing/router_fixture.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <optional>

namespace {

using onlyswap::schema::transaction_error_code;

const auto kRelayer = onlyswap::schema::make_account_id("permit2-relayer");

/// Key pair owning an account that authorizes transfers by permit.
struct permit_owner final {
  onlyswap::crypto::ed25519_keypair keypair;
  onlyswap::schema::account_id_t account;

  onlyswap::schema::permit_signature_t sign(
      const onlyswap::schema::hash32_t& digest) const {
    auto signature = onlyswap::crypto::sign_ed25519(
        keypair.private_key,
        onlyswap::schema::bytes_view_t{digest.data(), digest.size()});
    return onlyswap::schema::permit_signature_t{
        .signer = keypair.signer,
        .signature = signature.value_or(onlyswap::schema::ed25519_signature_t{})};
  }
};

std::optional<permit_owner> make_permit_owner() {
  auto keypair = onlyswap::crypto::generate_ed25519_keypair();
  if (!keypair) {
    return std::nullopt;
  }
  auto account = onlyswap::schema::make_account_id(
      onlyswap::schema::signer_id_t{keypair->signer});
  return permit_owner{.keypair = *keypair, .account = account};
}

std::shared_ptr<onlyswap::execution::signature_permit_relayer> install_relayer(
    onlyswap::testing::router_fixture& fixture,
    onlyswap::execution::ledger& chain,
    onlyswap::execution::router& router) {
  auto relayer =
      std::make_shared<onlyswap::execution::signature_permit_relayer>(kRelayer);
  chain.permit_relayers().deploy(kRelayer, relayer);
  EXPECT_EQ(router.set_permit2_relayer(fixture.as(fixture.admin), kRelayer).code,
            0u);
  return relayer;
}

void fund_owner(onlyswap::execution::ledger& chain,
                const onlyswap::schema::token_id_t& token,
                const onlyswap::schema::account_id_t& owner,
                const onlyswap::schema::amount_t& amount) {
  ASSERT_EQ(chain.tokens().mint(token, owner, amount).code, 0u);
  ASSERT_EQ(chain.tokens().approve(token, owner, kRelayer, amount).code, 0u);
}

onlyswap::schema::request_cross_chain_swap_permit2_t make_permit_request(
    const onlyswap::testing::router_fixture& fixture,
    const onlyswap::execution::signature_permit_relayer& relayer,
    const permit_owner& owner,
    const onlyswap::schema::request_cross_chain_swap_t& swap,
    const uint64_t nonce) {
  auto request = onlyswap::schema::request_cross_chain_swap_permit2_t{
      .swap = swap,
      .requester = owner.account,
      .permit = onlyswap::schema::permit_transfer_t{
          .token = swap.token_in,
          .amount = onlyswap::schema::amount_t{swap.amount_in + swap.solver_fee},
          .nonce = nonce,
          .deadline = onlyswap::testing::kGenesisTime + 3600},
      .additional_data = onlyswap::schema::make_bytes(std::string{"memo"}),
      .signature = {}};
  auto witness = onlyswap::execution::make_swap_request_witness(
      fixture.router_address, swap, request.additional_data);
  request.signature = owner.sign(relayer.permit_digest(
      onlyswap::testing::kSrcChainId, fixture.router_address, request.permit,
      witness));
  return request;
}

}  // namespace

TEST(permit2, requests_swap_with_signed_permit) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_permit_request"};
  auto owner = make_permit_owner();
  ASSERT_TRUE(owner.has_value());
  fixture.setup();
  auto relayer =
      install_relayer(fixture, fixture.src(), fixture.src_router());
  fund_owner(fixture.src(), fixture.token_src, owner->account, 5000);
  auto& router = fixture.src_router();

  auto request =
      make_permit_request(fixture, *relayer, *owner, fixture.make_swap(), 7);
  auto result = router.request_cross_chain_swap_permit2(
      fixture.as(fixture.stranger), request);
  ASSERT_EQ(result.code, 0u) << result.log;
  auto id = onlyswap::testing::result_id(result);

  auto stored = router.swap_request_parameters(id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->sender, owner->account);
  EXPECT_EQ(stored->verification_fee, 50);
  EXPECT_TRUE(relayer->is_nonce_used(fixture.src(), owner->account, 7));
  EXPECT_EQ(fixture.src().tokens().balance_of(fixture.token_src,
                                              owner->account),
            3990);
  EXPECT_EQ(fixture.src().tokens().balance_of(fixture.token_src,
                                              fixture.router_address),
            1010);

  auto replay = router.request_cross_chain_swap_permit2(
      fixture.as(fixture.stranger), request);
  EXPECT_TRUE(onlyswap::schema::has_error(
      replay, transaction_error_code::permit_nonce_used));
  EXPECT_EQ(router.current_swap_request_nonce(), 1u);
}

TEST(permit2, rejects_invalid_request_permits) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_permit_invalid"};
  auto owner = make_permit_owner();
  ASSERT_TRUE(owner.has_value());
  fixture.setup();
  auto& router = fixture.src_router();
  auto caller = fixture.as(fixture.stranger);

  auto unconfigured =
      onlyswap::execution::signature_permit_relayer{kRelayer};
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.request_cross_chain_swap_permit2(
          caller, make_permit_request(fixture, unconfigured, *owner,
                                      fixture.make_swap(), 1)),
      transaction_error_code::permit2_relayer_not_set));

  auto relayer =
      install_relayer(fixture, fixture.src(), fixture.src_router());
  fund_owner(fixture.src(), fixture.token_src, owner->account, 5000);

  auto tampered =
      make_permit_request(fixture, *relayer, *owner, fixture.make_swap(), 1);
  tampered.swap.amount_out = 1;
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.request_cross_chain_swap_permit2(caller, tampered),
      transaction_error_code::permit_invalid));

  auto impersonated =
      make_permit_request(fixture, *relayer, *owner, fixture.make_swap(), 2);
  impersonated.requester = fixture.requester;
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.request_cross_chain_swap_permit2(caller, impersonated),
      transaction_error_code::permit_invalid));

  auto wrong_token =
      make_permit_request(fixture, *relayer, *owner, fixture.make_swap(), 3);
  wrong_token.permit.token = fixture.token_dst;
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.request_cross_chain_swap_permit2(caller, wrong_token),
      transaction_error_code::permit_invalid));

  auto short_permit = fixture.make_swap();
  auto underfunded =
      make_permit_request(fixture, *relayer, *owner, short_permit, 4);
  underfunded.permit.amount = 1000;
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.request_cross_chain_swap_permit2(caller, underfunded),
      transaction_error_code::permit_invalid));

  auto expiring =
      make_permit_request(fixture, *relayer, *owner, fixture.make_swap(), 5);
  fixture.src().advance_time(3601);
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.request_cross_chain_swap_permit2(caller, expiring),
      transaction_error_code::permit_expired));

  EXPECT_EQ(router.current_swap_request_nonce(), 0u);
  EXPECT_FALSE(relayer->is_nonce_used(fixture.src(), owner->account, 1));
  EXPECT_EQ(fixture.src().tokens().balance_of(fixture.token_src,
                                              owner->account),
            5000);
}

TEST(permit2, relays_with_solver_permit) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_permit_relay"};
  auto solver = make_permit_owner();
  ASSERT_TRUE(solver.has_value());
  fixture.setup();
  auto relayer =
      install_relayer(fixture, fixture.dst(), fixture.dst_router());
  fund_owner(fixture.dst(), fixture.token_dst, solver->account, 950);
  auto id = fixture.request(fixture.make_swap());

  auto relay = onlyswap::schema::relay_tokens_permit2_t{
      .relay = fixture.make_relay(id),
      .solver = solver->account,
      .permit = onlyswap::schema::permit_transfer_t{
          .token = fixture.token_dst,
          .amount = 950,
          .nonce = 1,
          .deadline = onlyswap::testing::kGenesisTime + 600},
      .signature = {}};
  auto witness = onlyswap::execution::make_relay_witness(
      id, relay.relay.recipient,
      onlyswap::execution::make_solver_refund_payload(
          relay.relay.solver_refund_address));
  relay.signature = solver->sign(relayer->permit_digest(
      onlyswap::testing::kDstChainId, fixture.router_address, relay.permit,
      witness));

  auto redirected = relay;
  redirected.relay.solver_refund_address = fixture.stranger;
  EXPECT_TRUE(onlyswap::schema::has_error(
      fixture.dst_router().relay_tokens_permit2(fixture.as(fixture.stranger),
                                                redirected),
      transaction_error_code::permit_invalid));
  EXPECT_TRUE(fixture.dst_router().fulfilled_transfers().empty());

  auto result = fixture.dst_router().relay_tokens_permit2(
      fixture.as(fixture.stranger), relay);
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(onlyswap::testing::result_id(result), id);
  EXPECT_EQ(fixture.dst().tokens().balance_of(fixture.token_dst,
                                              fixture.recipient),
            950);
  EXPECT_EQ(fixture.dst().tokens().balance_of(fixture.token_dst,
                                              solver->account),
            0);
  EXPECT_TRUE(fixture.dst_router().swap_request_receipt(id)->fulfilled);

  EXPECT_TRUE(onlyswap::schema::has_error(
      fixture.dst_router().relay_tokens_permit2(fixture.as(fixture.stranger),
                                                relay),
      transaction_error_code::already_fulfilled));
}
