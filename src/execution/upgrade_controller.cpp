#include <onlyswap/execution/messages.hpp>
#include <onlyswap/execution/router_logic.hpp>
#include <onlyswap/execution/signature_verifier.hpp>
#include <onlyswap/execution/upgrade_controller.hpp>
#include <spdlog/spdlog.h>

namespace onlyswap::execution {

namespace {

using onlyswap::schema::transaction_error_code;

onlyswap::schema::transaction_result_t make_not_initialized() {
  return onlyswap::schema::make_error_result(
      transaction_error_code::not_initialized, "router is not initialized");
}

onlyswap::schema::implementation_id_t pending_implementation(
    const onlyswap::schema::router_state_t& router_state) {
  if (!router_state.scheduled_upgrade) {
    return onlyswap::schema::make_zero_hash();
  }
  return router_state.scheduled_upgrade->implementation;
}

}  // namespace

upgrade_controller::upgrade_controller(ledger& chain,
                                       swap_request_registry& registry)
    : chain_{chain}, registry_{registry} {}

onlyswap::schema::transaction_result_t upgrade_controller::schedule_upgrade(
    const call_context& context,
    const onlyswap::schema::implementation_id_t& new_implementation,
    const onlyswap::schema::bytes_t& init_payload,
    const onlyswap::schema::timestamp_seconds_t upgrade_time,
    const onlyswap::schema::bytes_t& signature) {
  auto router_state = registry_.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (onlyswap::schema::is_zero(new_implementation)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address,
        "implementation is the zero address");
  }
  if (!chain_.implementations().contains(new_implementation)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::unknown_implementation,
        "implementation " + onlyswap::schema::to_hex(new_implementation) +
            " is not deployed");
  }
  if (new_implementation == router_state->implementation ||
      new_implementation == pending_implementation(*router_state)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::same_version_upgrade_not_allowed,
        "implementation is already active or pending");
  }
  auto earliest = chain_.now() + router_state->minimum_contract_upgrade_delay;
  if (upgrade_time < earliest) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::upgrade_time_must_respect_delay,
        "upgrade time must be at least " + std::to_string(earliest));
  }

  auto message = make_contract_upgrade_message(
      scope(), kScheduleUpgradeAction, pending_implementation(*router_state),
      new_implementation, init_payload, upgrade_time,
      router_state->current_nonce + 1);
  auto authorized = authorize(*router_state, message, signature);
  if (!onlyswap::schema::succeeded(authorized)) {
    return authorized;
  }

  router_state->scheduled_upgrade = onlyswap::schema::scheduled_upgrade_t{
      .implementation = new_implementation,
      .init_payload = init_payload,
      .upgrade_time = upgrade_time};
  registry_.put_router_state(*router_state);

  chain_.emit("upgrade_scheduled",
              {make_attribute("implementation", new_implementation, true),
               make_attribute("upgrade_time", upgrade_time),
               make_attribute("nonce", router_state->current_nonce)});
  spdlog::info("Upgrade to {} scheduled at {} by {}",
               onlyswap::schema::to_hex(new_implementation), upgrade_time,
               onlyswap::schema::to_hex(context.caller));
  return {};
}

onlyswap::schema::transaction_result_t upgrade_controller::cancel_upgrade(
    const call_context& context,
    const onlyswap::schema::bytes_t& signature) {
  auto router_state = registry_.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (!router_state->scheduled_upgrade) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::no_upgrade_pending, "no upgrade is pending");
  }
  auto pending = *router_state->scheduled_upgrade;
  if (chain_.now() >= pending.upgrade_time) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::too_late_to_cancel_upgrade,
        "upgrade became executable at " + std::to_string(pending.upgrade_time));
  }

  auto message = make_contract_upgrade_message(
      scope(), kCancelUpgradeAction, pending.implementation,
      pending.implementation,
      pending.init_payload, pending.upgrade_time,
      router_state->current_nonce + 1);
  auto authorized = authorize(*router_state, message, signature);
  if (!onlyswap::schema::succeeded(authorized)) {
    return authorized;
  }

  router_state->scheduled_upgrade.reset();
  registry_.put_router_state(*router_state);

  chain_.emit("upgrade_cancelled",
              {make_attribute("implementation", pending.implementation, true),
               make_attribute("nonce", router_state->current_nonce)});
  spdlog::info("Upgrade to {} cancelled by {}",
               onlyswap::schema::to_hex(pending.implementation),
               onlyswap::schema::to_hex(context.caller));
  return {};
}

onlyswap::schema::transaction_result_t upgrade_controller::execute_upgrade(
    const call_context& context) {
  auto router_state = registry_.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (!router_state->scheduled_upgrade) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::no_upgrade_pending, "no upgrade is pending");
  }
  auto pending = *router_state->scheduled_upgrade;
  if (chain_.now() < pending.upgrade_time) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::upgrade_too_early,
        "upgrade executable from " + std::to_string(pending.upgrade_time));
  }
  auto logic = chain_.implementations().find(pending.implementation);
  if (!logic) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::unknown_implementation,
        "implementation " + onlyswap::schema::to_hex(pending.implementation) +
            " is not deployed");
  }

  auto previous = router_state->implementation;
  router_state->scheduled_upgrade.reset();
  router_state->implementation = pending.implementation;
  registry_.put_router_state(*router_state);

  auto settlement =
      settlement_context{.chain = chain_, .registry = registry_, .call = context};
  auto initialized = logic->on_upgrade(settlement, pending.init_payload);
  if (!onlyswap::schema::succeeded(initialized)) {
    if (initialized.codespace.empty()) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::upgrade_failed, initialized.log);
    }
    return initialized;
  }

  chain_.emit("upgrade_executed",
              {make_attribute("previous_implementation", previous),
               make_attribute("implementation", pending.implementation, true),
               make_attribute("version", logic->version())});
  spdlog::info("Router {} upgraded to {} ({})",
               onlyswap::schema::to_hex(registry_.router()),
               onlyswap::schema::to_hex(pending.implementation),
               logic->version());
  return {};
}

onlyswap::schema::transaction_result_t
upgrade_controller::set_swap_request_verifier(
    const call_context& context,
    const onlyswap::schema::account_id_t& verifier,
    const onlyswap::schema::bytes_t& signature) {
  return update_verifier(context, kChangeSwapRequestVerifierAction, verifier,
                         signature);
}

onlyswap::schema::transaction_result_t
upgrade_controller::set_contract_upgrade_verifier(
    const call_context& context,
    const onlyswap::schema::account_id_t& verifier,
    const onlyswap::schema::bytes_t& signature) {
  return update_verifier(context, kChangeContractUpgradeVerifierAction,
                         verifier, signature);
}

onlyswap::schema::transaction_result_t
upgrade_controller::set_minimum_contract_upgrade_delay(
    const call_context& context,
    const onlyswap::schema::duration_seconds_t delay,
    const onlyswap::schema::bytes_t& signature) {
  auto router_state = registry_.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (delay < kMinimumContractUpgradeDelayFloor) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::upgrade_delay_too_short,
        "upgrade delay must be at least " +
            std::to_string(kMinimumContractUpgradeDelayFloor) + " seconds");
  }
  auto message =
      make_duration_update_message(scope(), kChangeUpgradeDelayAction, delay,
                                   router_state->current_nonce + 1);
  auto authorized = authorize(*router_state, message, signature);
  if (!onlyswap::schema::succeeded(authorized)) {
    return authorized;
  }

  auto previous = router_state->minimum_contract_upgrade_delay;
  router_state->minimum_contract_upgrade_delay = delay;
  registry_.put_router_state(*router_state);
  chain_.emit("minimum_contract_upgrade_delay_updated",
              {make_attribute("previous", previous),
               make_attribute("delay", delay),
               make_attribute("nonce", router_state->current_nonce)});
  spdlog::info("Minimum upgrade delay changed from {} to {} by {}", previous,
               delay, onlyswap::schema::to_hex(context.caller));
  return {};
}

onlyswap::schema::transaction_result_t
upgrade_controller::set_cancellation_window(
    const call_context& context,
    const onlyswap::schema::duration_seconds_t window,
    const onlyswap::schema::bytes_t& signature) {
  auto router_state = registry_.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (window < kCancellationWindowFloor) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::swap_request_cancellation_window_too_short,
        "cancellation window must be at least " +
            std::to_string(kCancellationWindowFloor) + " seconds");
  }
  auto message = make_duration_update_message(
      scope(), kChangeCancellationWindowAction, window,
      router_state->current_nonce + 1);
  auto authorized = authorize(*router_state, message, signature);
  if (!onlyswap::schema::succeeded(authorized)) {
    return authorized;
  }

  auto previous = router_state->cancellation_window;
  router_state->cancellation_window = window;
  registry_.put_router_state(*router_state);
  chain_.emit("swap_request_cancellation_window_updated",
              {make_attribute("previous", previous),
               make_attribute("window", window),
               make_attribute("nonce", router_state->current_nonce)});
  spdlog::info("Cancellation window changed from {} to {} by {}", previous,
               window, onlyswap::schema::to_hex(context.caller));
  return {};
}

onlyswap::schema::bytes_t upgrade_controller::schedule_upgrade_message(
    const onlyswap::schema::implementation_id_t& new_implementation,
    const onlyswap::schema::bytes_t& init_payload,
    const onlyswap::schema::timestamp_seconds_t upgrade_time) const {
  auto router_state =
      registry_.router_state().value_or(onlyswap::schema::router_state_t{});
  return make_contract_upgrade_message(
      scope(), kScheduleUpgradeAction, pending_implementation(router_state),
      new_implementation, init_payload, upgrade_time,
      router_state.current_nonce + 1);
}

onlyswap::schema::bytes_t upgrade_controller::cancel_upgrade_message() const {
  auto router_state = registry_.router_state();
  if (!router_state || !router_state->scheduled_upgrade) {
    return {};
  }
  const auto& pending = *router_state->scheduled_upgrade;
  return make_contract_upgrade_message(
      scope(), kCancelUpgradeAction, pending.implementation,
      pending.implementation,
      pending.init_payload, pending.upgrade_time,
      router_state->current_nonce + 1);
}

onlyswap::schema::bytes_t upgrade_controller::verifier_update_message(
    const std::string_view action,
    const onlyswap::schema::account_id_t& verifier) const {
  auto router_state =
      registry_.router_state().value_or(onlyswap::schema::router_state_t{});
  return make_verifier_update_message(scope(), action, verifier,
                                      router_state.current_nonce + 1);
}

onlyswap::schema::bytes_t upgrade_controller::duration_update_message(
    const std::string_view action,
    const onlyswap::schema::duration_seconds_t duration) const {
  auto router_state =
      registry_.router_state().value_or(onlyswap::schema::router_state_t{});
  return make_duration_update_message(scope(), action, duration,
                                      router_state.current_nonce + 1);
}

governance_scope upgrade_controller::scope() const {
  return governance_scope{.chain_id = chain_.chain_id(),
                          .router = registry_.router()};
}

onlyswap::schema::transaction_result_t upgrade_controller::authorize(
    onlyswap::schema::router_state_t& router_state,
    const onlyswap::schema::bytes_t& message,
    const onlyswap::schema::bytes_t& signature) const {
  auto verifier =
      chain_.verifiers().find(router_state.contract_upgrade_verifier);
  if (!verifier) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::verifier_not_found,
        "contract upgrade verifier is not deployed");
  }
  if (!verifier->verify(onlyswap::schema::make_bytes_view(message),
                        onlyswap::schema::bytes_view_t{signature})) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::signature_verification_failed,
        "governance signature rejected");
  }
  router_state.current_nonce += 1;
  return {};
}

onlyswap::schema::transaction_result_t upgrade_controller::update_verifier(
    const call_context& context,
    const std::string_view action,
    const onlyswap::schema::account_id_t& verifier,
    const onlyswap::schema::bytes_t& signature) {
  auto router_state = registry_.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (onlyswap::schema::is_zero(verifier)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address, "verifier is the zero address");
  }
  auto message = make_verifier_update_message(scope(), action, verifier,
                                              router_state->current_nonce + 1);
  auto authorized = authorize(*router_state, message, signature);
  if (!onlyswap::schema::succeeded(authorized)) {
    return authorized;
  }

  auto swap_verifier = action == kChangeSwapRequestVerifierAction;
  auto& slot = swap_verifier ? router_state->swap_request_verifier
                             : router_state->contract_upgrade_verifier;
  auto previous = slot;
  slot = verifier;
  registry_.put_router_state(*router_state);
  chain_.emit(swap_verifier ? "swap_request_verifier_updated"
                            : "contract_upgrade_verifier_updated",
              {make_attribute("previous", previous),
               make_attribute("verifier", verifier, true),
               make_attribute("nonce", router_state->current_nonce)});
  spdlog::info("{} set to {} by {}", action, onlyswap::schema::to_hex(verifier),
               onlyswap::schema::to_hex(context.caller));
  return {};
}

}  // namespace onlyswap::execution
