#include <onlyswap/execution/messages.hpp>
#include <onlyswap/execution/settlement_engine.hpp>
#include <onlyswap/execution/upgrade_controller.hpp>
#include <onlyswap/testing/router_fixture.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string_view>

namespace {

using onlyswap::schema::transaction_error_code;

class settlement_engine_v2 final
    : public onlyswap::execution::settlement_engine {
 public:
  settlement_engine_v2() : settlement_engine{"2.0.0"} {}

  onlyswap::schema::transaction_result_t on_upgrade(
      onlyswap::execution::settlement_context& context,
      const onlyswap::schema::bytes_t& init_payload) override {
    if (init_payload == onlyswap::schema::make_bytes(std::string_view{"fail"})) {
      auto result = onlyswap::schema::transaction_result_t{};
      result.code = 99;
      result.log = "migration failed";
      return result;
    }
    last_payload_ = init_payload;
    ++migrations_;
    return settlement_engine::on_upgrade(context, init_payload);
  }

  int migrations() const { return migrations_; }
  const onlyswap::schema::bytes_t& last_payload() const {
    return last_payload_;
  }

 private:
  int migrations_{};
  onlyswap::schema::bytes_t last_payload_;
};

const auto kV2 = onlyswap::schema::make_account_id("settlement-engine-v2");

std::shared_ptr<settlement_engine_v2> deploy_v2(
    onlyswap::testing::router_fixture& fixture) {
  auto v2 = std::make_shared<settlement_engine_v2>();
  fixture.src().implementations().deploy(kV2, v2);
  return v2;
}

onlyswap::schema::timestamp_seconds_t earliest_upgrade_time(
    onlyswap::testing::router_fixture& fixture) {
  return fixture.src().now() +
         fixture.src_router().minimum_contract_upgrade_delay();
}

}  // namespace

TEST(scheduled_upgrade, swaps_implementation_after_delay) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_upgrade_ok"};
  ASSERT_TRUE(fixture.committee().available());
  fixture.setup();
  auto v2 = deploy_v2(fixture);
  auto& router = fixture.src_router();
  auto before = fixture.request(fixture.make_swap());
  EXPECT_EQ(router.version(), "1.0.0");

  auto payload = onlyswap::schema::make_bytes(std::string_view{"migrate"});
  auto upgrade_time = earliest_upgrade_time(fixture);
  auto authorization =
      router.contract_upgrade_params_to_bytes(kV2, payload, upgrade_time);
  auto scheduled = router.schedule_upgrade(
      fixture.as(fixture.stranger), kV2, payload, upgrade_time,
      fixture.committee().sign(authorization));
  ASSERT_EQ(scheduled.code, 0u) << scheduled.log;
  EXPECT_TRUE(onlyswap::testing::has_event(scheduled, "upgrade_scheduled"));
  EXPECT_EQ(router.current_nonce(), 1u);
  ASSERT_TRUE(router.scheduled_upgrade().has_value());
  EXPECT_EQ(router.scheduled_upgrade()->implementation, kV2);
  EXPECT_EQ(router.scheduled_upgrade()->upgrade_time, upgrade_time);

  fixture.src().set_time(upgrade_time - 1);
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.execute_upgrade(fixture.as(fixture.stranger)),
      transaction_error_code::upgrade_too_early));

  fixture.src().set_time(upgrade_time);
  auto executed = router.execute_upgrade(fixture.as(fixture.stranger));
  ASSERT_EQ(executed.code, 0u) << executed.log;
  EXPECT_EQ(onlyswap::testing::event_attribute(executed, "upgrade_executed",
                                               "version"),
            "2.0.0");
  EXPECT_EQ(router.implementation(), kV2);
  EXPECT_EQ(router.version(), "2.0.0");
  EXPECT_FALSE(router.scheduled_upgrade().has_value());
  EXPECT_EQ(v2->migrations(), 1);
  EXPECT_EQ(v2->last_payload(), payload);

  // Identity and state survive the swap.
  EXPECT_EQ(router.swap_request_status(before),
            onlyswap::schema::swap_request_status_t::unfulfilled);
  auto after = fixture.request(fixture.make_swap());
  EXPECT_EQ(router.swap_request_parameters(after)->nonce, 2u);

  EXPECT_TRUE(onlyswap::schema::has_error(
      router.execute_upgrade(fixture.as(fixture.stranger)),
      transaction_error_code::no_upgrade_pending));
}

TEST(scheduled_upgrade, validates_schedule_requests) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_upgrade_invalid"};
  ASSERT_TRUE(fixture.committee().available());
  fixture.setup();
  deploy_v2(fixture);
  auto& router = fixture.src_router();
  auto caller = fixture.as(fixture.stranger);
  auto time = earliest_upgrade_time(fixture);
  auto sign = [&](const onlyswap::schema::implementation_id_t& target,
                  const onlyswap::schema::timestamp_seconds_t at) {
    return fixture.committee().sign(
        router.contract_upgrade_params_to_bytes(target, {}, at));
  };

  EXPECT_TRUE(onlyswap::schema::has_error(
      router.schedule_upgrade(caller, onlyswap::schema::make_zero_hash(), {},
                              time, {}),
      transaction_error_code::zero_address));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.schedule_upgrade(caller, onlyswap::testing::make_hash(8), {}, time,
                              {}),
      transaction_error_code::unknown_implementation));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.schedule_upgrade(caller, fixture.implementation, {}, time,
                              sign(fixture.implementation, time)),
      transaction_error_code::same_version_upgrade_not_allowed));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.schedule_upgrade(caller, kV2, {}, time - 1, sign(kV2, time - 1)),
      transaction_error_code::upgrade_time_must_respect_delay));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.schedule_upgrade(caller, kV2, {}, time, sign(kV2, time + 1)),
      transaction_error_code::signature_verification_failed));
  EXPECT_EQ(router.current_nonce(), 0u);
  EXPECT_FALSE(router.scheduled_upgrade().has_value());

  ASSERT_EQ(
      router.schedule_upgrade(caller, kV2, {}, time, sign(kV2, time)).code, 0u);
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.schedule_upgrade(caller, kV2, {}, time + 10, sign(kV2, time + 10)),
      transaction_error_code::same_version_upgrade_not_allowed));
}

TEST(scheduled_upgrade, cancel_clears_pending_and_consumes_nonce) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_upgrade_cancel"};
  ASSERT_TRUE(fixture.committee().available());
  fixture.setup();
  deploy_v2(fixture);
  auto& router = fixture.src_router();
  auto caller = fixture.as(fixture.stranger);

  EXPECT_FALSE(router.cancel_upgrade_params_to_bytes().has_value());
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.cancel_upgrade(caller, {}),
      transaction_error_code::no_upgrade_pending));

  auto time = earliest_upgrade_time(fixture);
  auto schedule_signature = fixture.committee().sign(
      router.contract_upgrade_params_to_bytes(kV2, {}, time));
  ASSERT_EQ(router.schedule_upgrade(caller, kV2, {}, time, schedule_signature)
                .code,
            0u);

  auto cancel_authorization = router.cancel_upgrade_params_to_bytes();
  ASSERT_TRUE(cancel_authorization.has_value());
  auto cancelled = router.cancel_upgrade(
      caller, fixture.committee().sign(*cancel_authorization));
  ASSERT_EQ(cancelled.code, 0u) << cancelled.log;
  EXPECT_TRUE(onlyswap::testing::has_event(cancelled, "upgrade_cancelled"));
  EXPECT_FALSE(router.scheduled_upgrade().has_value());
  EXPECT_EQ(router.current_nonce(), 2u);

  // A consumed authorization cannot be replayed.
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.schedule_upgrade(caller, kV2, {}, time, schedule_signature),
      transaction_error_code::signature_verification_failed));
}

TEST(scheduled_upgrade, cannot_cancel_once_executable) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_upgrade_late"};
  ASSERT_TRUE(fixture.committee().available());
  fixture.setup();
  deploy_v2(fixture);
  auto& router = fixture.src_router();
  auto caller = fixture.as(fixture.stranger);

  auto time = earliest_upgrade_time(fixture);
  ASSERT_EQ(router
                .schedule_upgrade(caller, kV2, {}, time,
                                  fixture.committee().sign(
                                      router.contract_upgrade_params_to_bytes(
                                          kV2, {}, time)))
                .code,
            0u);
  auto cancel_signature =
      fixture.committee().sign(*router.cancel_upgrade_params_to_bytes());

  fixture.src().set_time(time);
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.cancel_upgrade(caller, cancel_signature),
      transaction_error_code::too_late_to_cancel_upgrade));
  EXPECT_TRUE(router.scheduled_upgrade().has_value());
}

TEST(scheduled_upgrade, failed_migration_reverts_upgrade) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_upgrade_fail"};
  ASSERT_TRUE(fixture.committee().available());
  fixture.setup();
  auto v2 = deploy_v2(fixture);
  auto& router = fixture.src_router();
  auto caller = fixture.as(fixture.stranger);

  auto payload = onlyswap::schema::make_bytes(std::string_view{"fail"});
  auto time = earliest_upgrade_time(fixture);
  ASSERT_EQ(router
                .schedule_upgrade(caller, kV2, payload, time,
                                  fixture.committee().sign(
                                      router.contract_upgrade_params_to_bytes(
                                          kV2, payload, time)))
                .code,
            0u);

  fixture.src().set_time(time);
  auto executed = router.execute_upgrade(caller);
  EXPECT_TRUE(onlyswap::schema::has_error(
      executed, transaction_error_code::upgrade_failed));
  EXPECT_EQ(executed.log, "migration failed");
  EXPECT_EQ(router.implementation(), fixture.implementation);
  EXPECT_TRUE(router.scheduled_upgrade().has_value());
  EXPECT_EQ(v2->migrations(), 0);
}

TEST(governance, updates_delay_window_and_verifiers) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_governance"};
  ASSERT_TRUE(fixture.committee().available());
  fixture.setup();
  auto& router = fixture.src_router();
  auto caller = fixture.as(fixture.stranger);
  const auto& committee = fixture.committee();
  constexpr auto kDay = onlyswap::schema::kSecondsPerDay;

  EXPECT_TRUE(onlyswap::schema::has_error(
      router.set_minimum_contract_upgrade_delay(
          caller, kDay,
          committee.sign(
              router.minimum_contract_upgrade_delay_params_to_bytes(kDay))),
      transaction_error_code::upgrade_delay_too_short));
  auto delay = router.set_minimum_contract_upgrade_delay(
      caller, 3 * kDay,
      committee.sign(
          router.minimum_contract_upgrade_delay_params_to_bytes(3 * kDay)));
  ASSERT_EQ(delay.code, 0u) << delay.log;
  EXPECT_EQ(router.minimum_contract_upgrade_delay(), 3 * kDay);

  EXPECT_TRUE(onlyswap::schema::has_error(
      router.set_cancellation_window(
          caller, kDay - 1,
          committee.sign(router.cancellation_window_params_to_bytes(kDay - 1))),
      transaction_error_code::swap_request_cancellation_window_too_short));
  auto window = router.set_cancellation_window(
      caller, 2 * kDay,
      committee.sign(router.cancellation_window_params_to_bytes(2 * kDay)));
  ASSERT_EQ(window.code, 0u) << window.log;
  EXPECT_EQ(router.cancellation_window(), 2 * kDay);

  auto verifier = onlyswap::testing::make_hash(21);
  auto authorized = committee.sign(router.verifier_update_params_to_bytes(
      onlyswap::execution::kChangeContractUpgradeVerifierAction, verifier));
  auto wrong_action = committee.sign(router.verifier_update_params_to_bytes(
      onlyswap::execution::kChangeSwapRequestVerifierAction, verifier));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.set_contract_upgrade_verifier(caller, verifier, wrong_action),
      transaction_error_code::signature_verification_failed));
  ASSERT_EQ(router.set_contract_upgrade_verifier(caller, verifier, authorized).code,
            0u);
  EXPECT_EQ(router.contract_upgrade_verifier(), verifier);
  EXPECT_EQ(router.current_nonce(), 3u);

  // The new verifier is not deployed, so governance is now locked.
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.set_cancellation_window(
          caller, 3 * kDay,
          committee.sign(router.cancellation_window_params_to_bytes(3 * kDay))),
      transaction_error_code::verifier_not_found));
  EXPECT_TRUE(onlyswap::schema::has_error(
      router.set_swap_request_verifier(caller,
                                       onlyswap::schema::make_zero_hash(), {}),
      transaction_error_code::zero_address));
}

TEST(governance, signatures_are_bound_to_one_router) {
  auto fixture = onlyswap::testing::router_fixture{"onlyswap_governance_scope"};
  ASSERT_TRUE(fixture.committee().available());
  fixture.setup();
  auto& src = fixture.src_router();
  auto& dst = fixture.dst_router();
  auto caller = fixture.as(fixture.stranger);
  const auto& committee = fixture.committee();
  constexpr auto kDay = onlyswap::schema::kSecondsPerDay;
  ASSERT_EQ(src.current_nonce(), dst.current_nonce());

  auto window = committee.sign(src.cancellation_window_params_to_bytes(2 * kDay));
  EXPECT_TRUE(onlyswap::schema::has_error(
      dst.set_cancellation_window(caller, 2 * kDay, window),
      transaction_error_code::signature_verification_failed));

  auto delay = committee.sign(
      src.minimum_contract_upgrade_delay_params_to_bytes(3 * kDay));
  EXPECT_TRUE(onlyswap::schema::has_error(
      dst.set_minimum_contract_upgrade_delay(caller, 3 * kDay, delay),
      transaction_error_code::signature_verification_failed));

  auto verifier = onlyswap::testing::make_hash(21);
  auto rotation = committee.sign(src.verifier_update_params_to_bytes(
      onlyswap::execution::kChangeSwapRequestVerifierAction, verifier));
  EXPECT_TRUE(onlyswap::schema::has_error(
      dst.set_swap_request_verifier(caller, verifier, rotation),
      transaction_error_code::signature_verification_failed));

  deploy_v2(fixture);
  fixture.dst().implementations().deploy(
      kV2, std::make_shared<settlement_engine_v2>());
  auto upgrade_time = earliest_upgrade_time(fixture);
  auto schedule = committee.sign(
      src.contract_upgrade_params_to_bytes(kV2, {}, upgrade_time));
  EXPECT_TRUE(onlyswap::schema::has_error(
      dst.schedule_upgrade(caller, kV2, {}, upgrade_time, schedule),
      transaction_error_code::signature_verification_failed));

  EXPECT_EQ(dst.cancellation_window(), kDay);
  EXPECT_EQ(dst.swap_request_verifier(), fixture.swap_request_verifier);
  EXPECT_FALSE(dst.scheduled_upgrade().has_value());
  EXPECT_EQ(dst.current_nonce(), 0u);

  // The same signatures remain valid on the router they were made for.
  EXPECT_EQ(src.set_cancellation_window(caller, 2 * kDay, window).code, 0u);
  EXPECT_EQ(src.cancellation_window(), 2 * kDay);
}
