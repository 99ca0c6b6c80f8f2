#include <onlyswap/testing/router_fixture.hpp>
#include <gtest/gtest.h>

namespace {

using onlyswap::schema::transaction_error_code;

}  // namespace

TEST(swap_request_cancellation, refunds_after_window) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_cancel_ok"};
  fixture.setup();
  auto& router = fixture.src_router();
  auto id = fixture.request(fixture.make_swap(1000, 950, 10));
  auto requester = fixture.as(fixture.requester);

  fixture.src().advance_time(60);
  auto staged = router.stage_swap_request_cancellation(requester, id);
  ASSERT_EQ(staged.code, 0u) << staged.log;
  EXPECT_TRUE(onlyswap::testing::has_event(staged,
                                           "swap_request_cancellation_staged"));
  EXPECT_EQ(router.swap_request_cancellation_initiated_at(id),
            onlyswap::testing::kGenesisTime + 60);
  EXPECT_EQ(router.swap_request_status(id),
            onlyswap::schema::swap_request_status_t::unfulfilled);

  fixture.src().advance_time(router.cancellation_window());
  auto cancelled =
      router.cancel_swap_request_and_refund(requester, id, fixture.recipient);
  ASSERT_EQ(cancelled.code, 0u) << cancelled.log;
  EXPECT_EQ(onlyswap::testing::event_attribute(
                cancelled, "swap_request_refund_claimed", "amount"),
            "1010");

  EXPECT_EQ(router.swap_request_status(id),
            onlyswap::schema::swap_request_status_t::cancelled);
  EXPECT_TRUE(router.swap_request_parameters(id)->executed);
  EXPECT_EQ(router.cancelled_swap_requests(),
            std::vector<onlyswap::schema::hash32_t>{id});
  EXPECT_TRUE(router.unfulfilled_solver_refunds().empty());
  EXPECT_EQ(router.solver_refund_amount(id), 0);
  EXPECT_EQ(router.total_verification_fee_balance(fixture.token_src), 0);

  auto& tokens = fixture.src().tokens();
  EXPECT_EQ(tokens.balance_of(fixture.token_src, fixture.recipient), 1010);
  EXPECT_EQ(tokens.balance_of(fixture.token_src, fixture.router_address), 0);

  EXPECT_TRUE(onlyswap::schema::has_error(
      router.cancel_swap_request_and_refund(requester, id, fixture.recipient),
      transaction_error_code::already_fulfilled));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.rebalance_solver(fixture.as(fixture.solver), fixture.solver, id,
                              fixture.sign_rebalance(id, fixture.solver)),
      transaction_error_code::already_fulfilled));
}

TEST(swap_request_cancellation, enforces_staging_and_window) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_cancel_window"};
  fixture.setup();
  auto& router = fixture.src_router();
  auto id = fixture.request(fixture.make_swap());
  auto requester = fixture.as(fixture.requester);

  EXPECT_EQ(router.swap_request_cancellation_initiated_at(id), 0u);
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.cancel_swap_request_and_refund(requester, id, fixture.requester),
      transaction_error_code::swap_request_cancellation_not_staged));

  ASSERT_EQ(router.stage_swap_request_cancellation(requester, id).code, 0u);
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.stage_swap_request_cancellation(requester, id),
      transaction_error_code::swap_request_cancellation_already_staged));

  fixture.src().advance_time(router.cancellation_window() - 1);
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.cancel_swap_request_and_refund(requester, id, fixture.requester),
      transaction_error_code::swap_request_cancellation_window_not_passed));

  fixture.src().advance_time(1);
  EXPECT_EQ(router
                .cancel_swap_request_and_refund(requester, id,
                                                fixture.requester)
                .code,
            0u);
}

TEST(swap_request_cancellation, only_sender_may_cancel) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_cancel_sender"};
  fixture.setup();
  auto& router = fixture.src_router();
  auto id = fixture.request(fixture.make_swap());
  auto stranger = fixture.as(fixture.stranger);

  EXPECT_TRUE(onlyswap::schema::has_error(
      router.stage_swap_request_cancellation(stranger, id),
      transaction_error_code::unauthorised_caller));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.stage_swap_request_cancellation(fixture.as(fixture.requester),
                                             onlyswap::testing::make_hash(4)),
      transaction_error_code::unauthorised_caller));

  ASSERT_EQ(router
                .stage_swap_request_cancellation(fixture.as(fixture.requester),
                                                 id)
                .code,
            0u);
  fixture.src().advance_time(router.cancellation_window());

  EXPECT_TRUE(onlyswap::schema::has_error(
      router.cancel_swap_request_and_refund(stranger, id, fixture.stranger),
      transaction_error_code::unauthorised_caller));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.cancel_swap_request_and_refund(
          fixture.as(fixture.requester), id,
          onlyswap::schema::make_zero_hash()),
      transaction_error_code::zero_address));
  EXPECT_EQ(router.swap_request_status(id),
            onlyswap::schema::swap_request_status_t::unfulfilled);
}

TEST(swap_request_cancellation, requires_reserved_fee_balance) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_cancel_fee"};
  fixture.setup();
  auto& router = fixture.src_router();
  auto id = fixture.request(fixture.make_swap(1000, 950, 10));
  auto requester = fixture.as(fixture.requester);

  ASSERT_EQ(router.stage_swap_request_cancellation(requester, id).code, 0u);
  ASSERT_EQ(router
                .withdraw_verification_fee(fixture.as(fixture.admin),
                                           fixture.token_src, fixture.admin)
                .code,
            0u);
  fixture.src().advance_time(router.cancellation_window());

  EXPECT_TRUE(onlyswap::schema::has_error(
      router.cancel_swap_request_and_refund(requester, id, fixture.requester),
      transaction_error_code::insufficient_verification_fee_balance));
  EXPECT_EQ(router.swap_request_status(id),
            onlyswap::schema::swap_request_status_t::unfulfilled);
  EXPECT_EQ(fixture.src().tokens().balance_of(fixture.token_src,
                                              fixture.router_address),
            960);
}
