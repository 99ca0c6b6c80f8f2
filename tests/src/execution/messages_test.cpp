#include <onlyswap/execution/messages.hpp>
#include <onlyswap/execution/signature_verifier.hpp>
#include <onlyswap/testing/common.hpp>
#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

namespace {

onlyswap::schema::swap_request_t make_request() {
  return onlyswap::schema::swap_request_t{
      .sender = onlyswap::testing::make_hash(1),
      .recipient = onlyswap::testing::make_hash(2),
      .token_in = onlyswap::testing::make_hash(3),
      .token_out = onlyswap::testing::make_hash(4),
      .amount_in = 1000,
      .amount_out = 950,
      .src_chain_id = 1,
      .dst_chain_id = 2,
      .verification_fee = 50,
      .solver_fee = 10,
      .nonce = 1,
      .executed = false,
      .requested_at = 1'700'000'000,
      .pre_hooks = {},
      .post_hooks = {}};
}

onlyswap::schema::hook_t make_hook(const uint8_t seed) {
  return onlyswap::schema::hook_t{.target = onlyswap::testing::make_hash(seed),
                                  .payload = {seed},
                                  .gas_limit = 1000};
}

}  // namespace

TEST(messages, request_id_matches_field_overload) {
  auto request = make_request();
  auto id = onlyswap::execution::make_request_id(request);
  EXPECT_EQ(id, onlyswap::execution::make_request_id(
                    request.sender, request.recipient, request.token_in,
                    request.token_out, request.amount_out,
                    request.src_chain_id, request.dst_chain_id, request.nonce,
                    request.pre_hooks, request.post_hooks));
  EXPECT_FALSE(onlyswap::schema::is_zero(id));
}

TEST(messages, request_id_ignores_mutable_and_source_only_fields) {
  auto request = make_request();
  auto id = onlyswap::execution::make_request_id(request);

  auto changed = request;
  changed.solver_fee = 99;
  changed.executed = true;
  changed.amount_in = 5000;
  changed.verification_fee = 250;
  changed.requested_at += 60;
  EXPECT_EQ(onlyswap::execution::make_request_id(changed), id);
}

TEST(messages, request_id_binds_every_relayed_field) {
  auto request = make_request();
  auto id = onlyswap::execution::make_request_id(request);

  auto nonce = request;
  nonce.nonce = 2;
  EXPECT_NE(onlyswap::execution::make_request_id(nonce), id);

  auto amount = request;
  amount.amount_out = 949;
  EXPECT_NE(onlyswap::execution::make_request_id(amount), id);

  auto chains = request;
  std::swap(chains.src_chain_id, chains.dst_chain_id);
  EXPECT_NE(onlyswap::execution::make_request_id(chains), id);

  auto hooks = request;
  hooks.post_hooks = {make_hook(7)};
  EXPECT_NE(onlyswap::execution::make_request_id(hooks), id);

  auto moved = request;
  moved.pre_hooks = {make_hook(7)};
  EXPECT_NE(onlyswap::execution::make_request_id(moved),
            onlyswap::execution::make_request_id(hooks));
}

TEST(messages, hooks_hash_is_order_sensitive) {
  auto empty = onlyswap::execution::hooks_hash({});
  EXPECT_EQ(empty, onlyswap::execution::hooks_hash({}));
  auto forward =
      onlyswap::execution::hooks_hash({make_hook(1), make_hook(2)});
  auto backward =
      onlyswap::execution::hooks_hash({make_hook(2), make_hook(1)});
  EXPECT_NE(forward, backward);
  EXPECT_NE(forward, empty);

  auto gas = make_hook(1);
  gas.gas_limit = 1;
  EXPECT_NE(onlyswap::execution::hooks_hash({gas}),
            onlyswap::execution::hooks_hash({make_hook(1)}));
}

TEST(messages, rebalance_message_names_the_solver) {
  auto request = make_request();
  auto first = onlyswap::execution::make_rebalance_message(
      onlyswap::testing::make_hash(10), request);
  auto second = onlyswap::execution::make_rebalance_message(
      onlyswap::testing::make_hash(11), request);
  EXPECT_NE(first, second);

  // A fee bump after signing must not invalidate the committee signature.
  auto bumped = request;
  bumped.solver_fee = 20;
  EXPECT_EQ(onlyswap::execution::make_rebalance_message(
                onlyswap::testing::make_hash(10), bumped),
            first);
}

TEST(messages, rebalance_message_binds_every_request_field) {
  auto request = make_request();
  auto solver = onlyswap::testing::make_hash(10);
  auto signed_message =
      onlyswap::execution::make_rebalance_message(solver, request);

  auto flips = std::vector<onlyswap::schema::swap_request_t>{};
  auto flip = [&](auto&& change) {
    auto changed = request;
    change(changed);
    flips.push_back(changed);
  };
  flip([](auto& r) { r.sender = onlyswap::testing::make_hash(21); });
  flip([](auto& r) { r.recipient = onlyswap::testing::make_hash(22); });
  flip([](auto& r) { r.token_in = onlyswap::testing::make_hash(23); });
  flip([](auto& r) { r.token_out = onlyswap::testing::make_hash(24); });
  flip([](auto& r) { r.amount_in = 1001; });
  flip([](auto& r) { r.amount_out = 951; });
  flip([](auto& r) { r.src_chain_id = 3; });
  flip([](auto& r) { r.dst_chain_id = 3; });
  flip([](auto& r) { r.nonce = 2; });
  flip([](auto& r) { r.pre_hooks = {make_hook(5)}; });
  flip([](auto& r) { r.post_hooks = {make_hook(5)}; });

  for (auto i = std::size_t{0}; i < flips.size(); ++i) {
    EXPECT_NE(onlyswap::execution::make_rebalance_message(solver, flips[i]),
              signed_message)
        << "field flip " << i;
  }
}

TEST(messages, governance_messages_bind_action_and_nonce) {
  auto scope = onlyswap::execution::governance_scope{
      .chain_id = 1, .router = onlyswap::testing::make_hash(8)};
  auto implementation = onlyswap::testing::make_hash(5);
  auto schedule = onlyswap::execution::make_contract_upgrade_message(
      scope, onlyswap::execution::kScheduleUpgradeAction,
      onlyswap::schema::make_zero_hash(), implementation, {}, 100, 1);
  EXPECT_NE(schedule, onlyswap::execution::make_contract_upgrade_message(
                          scope, onlyswap::execution::kCancelUpgradeAction,
                          onlyswap::schema::make_zero_hash(), implementation,
                          {}, 100, 1));
  EXPECT_NE(schedule, onlyswap::execution::make_contract_upgrade_message(
                          scope, onlyswap::execution::kScheduleUpgradeAction,
                          onlyswap::schema::make_zero_hash(), implementation,
                          {}, 100, 2));

  auto verifier = onlyswap::testing::make_hash(6);
  EXPECT_NE(onlyswap::execution::make_verifier_update_message(
                scope, onlyswap::execution::kChangeSwapRequestVerifierAction,
                verifier, 1),
            onlyswap::execution::make_verifier_update_message(
                scope,
                onlyswap::execution::kChangeContractUpgradeVerifierAction,
                verifier, 1));
  EXPECT_NE(onlyswap::execution::make_duration_update_message(
                scope, onlyswap::execution::kChangeUpgradeDelayAction, 86400,
                1),
            onlyswap::execution::make_duration_update_message(
                scope, onlyswap::execution::kChangeCancellationWindowAction,
                86400, 1));
}

TEST(messages, governance_messages_bind_chain_and_router) {
  auto scope = onlyswap::execution::governance_scope{
      .chain_id = 1, .router = onlyswap::testing::make_hash(8)};
  auto other_chain = scope;
  other_chain.chain_id = 2;
  auto other_router = scope;
  other_router.router = onlyswap::testing::make_hash(9);

  for (const auto& other : {other_chain, other_router}) {
    EXPECT_NE(onlyswap::execution::make_duration_update_message(
                  scope, onlyswap::execution::kChangeCancellationWindowAction,
                  172800, 1),
              onlyswap::execution::make_duration_update_message(
                  other, onlyswap::execution::kChangeCancellationWindowAction,
                  172800, 1));
    EXPECT_NE(onlyswap::execution::make_verifier_update_message(
                  scope,
                  onlyswap::execution::kChangeSwapRequestVerifierAction,
                  onlyswap::testing::make_hash(6), 1),
              onlyswap::execution::make_verifier_update_message(
                  other,
                  onlyswap::execution::kChangeSwapRequestVerifierAction,
                  onlyswap::testing::make_hash(6), 1));
    EXPECT_NE(onlyswap::execution::make_contract_upgrade_message(
                  scope, onlyswap::execution::kScheduleUpgradeAction,
                  onlyswap::schema::make_zero_hash(),
                  onlyswap::testing::make_hash(5), {}, 100, 1),
              onlyswap::execution::make_contract_upgrade_message(
                  other, onlyswap::execution::kScheduleUpgradeAction,
                  onlyswap::schema::make_zero_hash(),
                  onlyswap::testing::make_hash(5), {}, 100, 1));
  }
}

TEST(messages, domain_digests_separate_tags) {
  auto message = onlyswap::schema::make_bytes(std::string{"payload"});
  auto view = onlyswap::schema::make_bytes_view(message);
  EXPECT_EQ(onlyswap::execution::make_domain_digest(
                onlyswap::execution::kSwapRequestDomainTag, view),
            onlyswap::execution::make_domain_digest(
                onlyswap::execution::kSwapRequestDomainTag, view));
  EXPECT_NE(onlyswap::execution::make_domain_digest(
                onlyswap::execution::kSwapRequestDomainTag, view),
            onlyswap::execution::make_domain_digest(
                onlyswap::execution::kContractUpgradeDomainTag, view));
}

TEST(messages, witnesses_bind_additional_data) {
  auto router = onlyswap::testing::make_hash(8);
  auto swap = onlyswap::schema::request_cross_chain_swap_t{
      .token_in = onlyswap::testing::make_hash(3),
      .token_out = onlyswap::testing::make_hash(4),
      .amount_in = 1000,
      .amount_out = 950,
      .solver_fee = 10,
      .dst_chain_id = 2,
      .recipient = onlyswap::testing::make_hash(2),
      .pre_hooks = {},
      .post_hooks = {}};
  EXPECT_NE(onlyswap::execution::make_swap_request_witness(router, swap, {}),
            onlyswap::execution::make_swap_request_witness(router, swap, {1}));

  auto id = onlyswap::testing::make_hash(9);
  auto recipient = onlyswap::testing::make_hash(2);
  EXPECT_NE(onlyswap::execution::make_relay_witness(
                id, recipient,
                onlyswap::execution::make_solver_refund_payload(
                    onlyswap::testing::make_hash(10))),
            onlyswap::execution::make_relay_witness(
                id, recipient,
                onlyswap::execution::make_solver_refund_payload(
                    onlyswap::testing::make_hash(11))));
}
