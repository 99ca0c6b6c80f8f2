#include <onlyswap/execution/messages.hpp>
#include <onlyswap/execution/router.hpp>
#include <onlyswap/execution/signature_verifier.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace onlyswap::execution {

namespace {

using onlyswap::schema::transaction_error_code;

onlyswap::schema::transaction_result_t make_not_initialized() {
  return onlyswap::schema::make_error_result(
      transaction_error_code::not_initialized, "router is not initialized");
}

authorization_message make_authorization_message(
    const std::string_view domain_tag,
    onlyswap::schema::bytes_t message) {
  auto digest = make_domain_digest(domain_tag,
                                   onlyswap::schema::make_bytes_view(message));
  return authorization_message{.message = std::move(message),
                               .digest = digest};
}

}  // namespace

router::router(ledger& chain,
               onlyswap::schema::account_id_t address,
               onlyswap::config::router_config config)
    : chain_{chain},
      address_{address},
      config_{std::move(config)},
      registry_{chain.state(), address_},
      upgrades_{chain, registry_} {}

template <typename Fn>
onlyswap::schema::transaction_result_t router::dispatch(
    const std::string_view operation,
    const call_context& context,
    Fn&& fn) {
  return finish(operation, chain_.execute([&]() {
    auto router_state = registry_.router_state();
    if (!router_state) {
      return make_not_initialized();
    }
    auto logic = chain_.implementations().find(router_state->implementation);
    if (!logic) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::unknown_implementation,
          "active implementation " +
              onlyswap::schema::to_hex(router_state->implementation) +
              " is not deployed");
    }
    auto settlement = settlement_context{
        .chain = chain_, .registry = registry_, .call = context};
    return std::forward<Fn>(fn)(*logic, settlement);
  }));
}

template <typename Fn>
onlyswap::schema::transaction_result_t router::administer(
    const std::string_view operation,
    const call_context& context,
    Fn&& fn) {
  return finish(operation, chain_.execute([&]() {
    auto router_state = registry_.router_state();
    if (!router_state) {
      return make_not_initialized();
    }
    if (!registry_.is_admin(context.caller)) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::access_denied,
          onlyswap::schema::to_hex(context.caller) + " is not an admin");
    }
    return std::forward<Fn>(fn)(*router_state);
  }));
}

template <typename Fn>
onlyswap::schema::transaction_result_t router::govern(
    const std::string_view operation,
    Fn&& fn) {
  return finish(operation, chain_.execute(std::forward<Fn>(fn)));
}

onlyswap::schema::transaction_result_t router::finish(
    const std::string_view operation,
    onlyswap::schema::transaction_result_t result) const {
  if (onlyswap::schema::succeeded(result)) {
    spdlog::debug("{} on router {} succeeded with {} event(s)", operation,
                  onlyswap::schema::to_hex(address_), result.events.size());
  } else {
    spdlog::warn("{} on router {} rejected: {} ({})", operation,
                 onlyswap::schema::to_hex(address_), result.log, result.info);
  }
  return result;
}

onlyswap::schema::router_state_t router::current_state() const {
  return registry_.router_state().value_or(onlyswap::schema::router_state_t{});
}

onlyswap::schema::transaction_result_t router::initialize(
    const call_context& context,
    const onlyswap::schema::account_id_t& owner,
    const onlyswap::schema::account_id_t& swap_request_verifier,
    const onlyswap::schema::account_id_t& contract_upgrade_verifier,
    const onlyswap::schema::implementation_id_t& implementation) {
  return finish("initialize", chain_.execute([&]() {
    if (registry_.router_state().has_value()) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::already_initialized,
          "router is already initialized");
    }
    if (onlyswap::schema::is_zero(owner) ||
        onlyswap::schema::is_zero(swap_request_verifier) ||
        onlyswap::schema::is_zero(contract_upgrade_verifier) ||
        onlyswap::schema::is_zero(implementation)) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::zero_address,
          "owner, verifiers and implementation must be set");
    }
    if (!chain_.implementations().contains(implementation)) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::unknown_implementation,
          "implementation " + onlyswap::schema::to_hex(implementation) +
              " is not deployed");
    }
    if (auto error = validate_fee_bps(config_.verification_fee_bps,
                                      config_.max_fee_bps)) {
      return onlyswap::schema::make_error_result(
          *error, "verification fee bps " +
                      std::to_string(config_.verification_fee_bps) +
                      " out of range");
    }
    if (config_.minimum_contract_upgrade_delay <
        kMinimumContractUpgradeDelayFloor) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::upgrade_delay_too_short,
          "configured upgrade delay below floor");
    }
    if (config_.cancellation_window < kCancellationWindowFloor) {
      return onlyswap::schema::make_error_result(
          transaction_error_code::swap_request_cancellation_window_too_short,
          "configured cancellation window below floor");
    }

    registry_.put_router_state(onlyswap::schema::router_state_t{
        .implementation = implementation,
        .swap_request_verifier = swap_request_verifier,
        .contract_upgrade_verifier = contract_upgrade_verifier,
        .hook_executor = onlyswap::schema::make_zero_hash(),
        .permit2_relayer = onlyswap::schema::make_zero_hash(),
        .verification_fee_bps = config_.verification_fee_bps,
        .cancellation_window = config_.cancellation_window,
        .current_swap_request_nonce = 0,
        .minimum_contract_upgrade_delay =
            config_.minimum_contract_upgrade_delay,
        .current_nonce = 0,
        .scheduled_upgrade = std::nullopt});
    registry_.set_admin(owner, true);

    chain_.emit("router_initialized",
                {make_attribute("router", address_, true),
                 make_attribute("owner", owner),
                 make_attribute("implementation", implementation),
                 make_attribute("initialized_by", context.caller)});
    chain_.emit("admin_role_granted",
                {make_attribute("account", owner, true),
                 make_attribute("granted_by", context.caller)});
    spdlog::info("Router {} initialized on chain {} with owner {}",
                 onlyswap::schema::to_hex(address_), chain_.chain_id(),
                 onlyswap::schema::to_hex(owner));
    return onlyswap::schema::transaction_result_t{};
  }));
}

onlyswap::schema::transaction_result_t router::request_cross_chain_swap(
    const call_context& context,
    const onlyswap::schema::request_cross_chain_swap_t& swap) {
  return dispatch("request_cross_chain_swap", context,
                  [&](router_logic& logic, settlement_context& settlement) {
                    return logic.request_cross_chain_swap(settlement, swap);
                  });
}

onlyswap::schema::transaction_result_t
router::request_cross_chain_swap_permit2(
    const call_context& context,
    const onlyswap::schema::request_cross_chain_swap_permit2_t& swap) {
  return dispatch(
      "request_cross_chain_swap_permit2", context,
      [&](router_logic& logic, settlement_context& settlement) {
        return logic.request_cross_chain_swap_permit2(settlement, swap);
      });
}

onlyswap::schema::transaction_result_t
router::update_solver_fees_if_unfulfilled(
    const call_context& context,
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::amount_t& new_fee) {
  return dispatch(
      "update_solver_fees_if_unfulfilled", context,
      [&](router_logic& logic, settlement_context& settlement) {
        return logic.update_solver_fees_if_unfulfilled(settlement, request_id,
                                                       new_fee);
      });
}

onlyswap::schema::transaction_result_t router::relay_tokens(
    const call_context& context,
    const onlyswap::schema::relay_tokens_t& relay) {
  return dispatch("relay_tokens", context,
                  [&](router_logic& logic, settlement_context& settlement) {
                    return logic.relay_tokens(settlement, relay);
                  });
}

onlyswap::schema::transaction_result_t router::relay_tokens_permit2(
    const call_context& context,
    const onlyswap::schema::relay_tokens_permit2_t& relay) {
  return dispatch("relay_tokens_permit2", context,
                  [&](router_logic& logic, settlement_context& settlement) {
                    return logic.relay_tokens_permit2(settlement, relay);
                  });
}

onlyswap::schema::transaction_result_t router::rebalance_solver(
    const call_context& context,
    const onlyswap::schema::account_id_t& solver,
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::bytes_t& signature) {
  return dispatch("rebalance_solver", context,
                  [&](router_logic& logic, settlement_context& settlement) {
                    return logic.rebalance_solver(settlement, solver,
                                                  request_id, signature);
                  });
}

onlyswap::schema::transaction_result_t router::stage_swap_request_cancellation(
    const call_context& context,
    const onlyswap::schema::hash32_t& request_id) {
  return dispatch(
      "stage_swap_request_cancellation", context,
      [&](router_logic& logic, settlement_context& settlement) {
        return logic.stage_swap_request_cancellation(settlement, request_id);
      });
}

onlyswap::schema::transaction_result_t router::cancel_swap_request_and_refund(
    const call_context& context,
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::account_id_t& refund_recipient) {
  return dispatch("cancel_swap_request_and_refund", context,
                  [&](router_logic& logic, settlement_context& settlement) {
                    return logic.cancel_swap_request_and_refund(
                        settlement, request_id, refund_recipient);
                  });
}

onlyswap::schema::transaction_result_t router::schedule_upgrade(
    const call_context& context,
    const onlyswap::schema::implementation_id_t& new_implementation,
    const onlyswap::schema::bytes_t& init_payload,
    const onlyswap::schema::timestamp_seconds_t upgrade_time,
    const onlyswap::schema::bytes_t& signature) {
  return govern("schedule_upgrade", [&]() {
    return upgrades_.schedule_upgrade(context, new_implementation,
                                      init_payload, upgrade_time, signature);
  });
}

onlyswap::schema::transaction_result_t router::cancel_upgrade(
    const call_context& context,
    const onlyswap::schema::bytes_t& signature) {
  return govern("cancel_upgrade", [&]() {
    return upgrades_.cancel_upgrade(context, signature);
  });
}

onlyswap::schema::transaction_result_t router::execute_upgrade(
    const call_context& context) {
  return govern("execute_upgrade",
                [&]() { return upgrades_.execute_upgrade(context); });
}

onlyswap::schema::transaction_result_t router::set_swap_request_verifier(
    const call_context& context,
    const onlyswap::schema::account_id_t& verifier,
    const onlyswap::schema::bytes_t& signature) {
  return govern("set_swap_request_verifier", [&]() {
    return upgrades_.set_swap_request_verifier(context, verifier, signature);
  });
}

onlyswap::schema::transaction_result_t router::set_contract_upgrade_verifier(
    const call_context& context,
    const onlyswap::schema::account_id_t& verifier,
    const onlyswap::schema::bytes_t& signature) {
  return govern("set_contract_upgrade_verifier", [&]() {
    return upgrades_.set_contract_upgrade_verifier(context, verifier,
                                                   signature);
  });
}

onlyswap::schema::transaction_result_t
router::set_minimum_contract_upgrade_delay(
    const call_context& context,
    const onlyswap::schema::duration_seconds_t delay,
    const onlyswap::schema::bytes_t& signature) {
  return govern("set_minimum_contract_upgrade_delay", [&]() {
    return upgrades_.set_minimum_contract_upgrade_delay(context, delay,
                                                        signature);
  });
}

onlyswap::schema::transaction_result_t router::set_cancellation_window(
    const call_context& context,
    const onlyswap::schema::duration_seconds_t window,
    const onlyswap::schema::bytes_t& signature) {
  return govern("set_cancellation_window", [&]() {
    return upgrades_.set_cancellation_window(context, window, signature);
  });
}

onlyswap::schema::transaction_result_t router::set_verification_fee_bps(
    const call_context& context,
    const uint32_t fee_bps) {
  return administer(
      "set_verification_fee_bps", context,
      [&](onlyswap::schema::router_state_t& router_state) {
        if (auto error = validate_fee_bps(fee_bps, config_.max_fee_bps)) {
          return onlyswap::schema::make_error_result(
              *error, "verification fee bps " + std::to_string(fee_bps) +
                          " out of range");
        }
        auto previous = router_state.verification_fee_bps;
        router_state.verification_fee_bps = fee_bps;
        registry_.put_router_state(router_state);
        chain_.emit("verification_fee_bps_updated",
                    {make_attribute("previous", uint64_t{previous}),
                     make_attribute("fee_bps", uint64_t{fee_bps})});
        return onlyswap::schema::transaction_result_t{};
      });
}

onlyswap::schema::transaction_result_t router::permit_destination_chain_id(
    const call_context& context,
    const onlyswap::schema::chain_id_t chain_id) {
  return administer("permit_destination_chain_id", context,
                    [&](onlyswap::schema::router_state_t&) {
                      registry_.set_destination_chain_permitted(chain_id, true);
                      chain_.emit("destination_chain_id_permitted",
                                  {make_attribute("chain_id", chain_id, true)});
                      return onlyswap::schema::transaction_result_t{};
                    });
}

onlyswap::schema::transaction_result_t router::block_destination_chain_id(
    const call_context& context,
    const onlyswap::schema::chain_id_t chain_id) {
  return administer(
      "block_destination_chain_id", context,
      [&](onlyswap::schema::router_state_t&) {
        registry_.set_destination_chain_permitted(chain_id, false);
        chain_.emit("destination_chain_id_blocked",
                    {make_attribute("chain_id", chain_id, true)});
        return onlyswap::schema::transaction_result_t{};
      });
}

onlyswap::schema::transaction_result_t router::set_token_mapping(
    const call_context& context,
    const onlyswap::schema::chain_id_t dst_chain_id,
    const onlyswap::schema::token_id_t& dst_token,
    const onlyswap::schema::token_id_t& src_token) {
  return administer(
      "set_token_mapping", context, [&](onlyswap::schema::router_state_t&) {
        if (onlyswap::schema::is_zero(dst_token) ||
            onlyswap::schema::is_zero(src_token)) {
          return onlyswap::schema::make_error_result(
              transaction_error_code::invalid_token_or_recipient,
              "source and destination tokens must be set");
        }
        if (!registry_.is_destination_chain_permitted(dst_chain_id)) {
          return onlyswap::schema::make_error_result(
              transaction_error_code::destination_chain_id_not_supported,
              "destination chain " + std::to_string(dst_chain_id) +
                  " is not permitted");
        }
        if (!registry_.token_mapping(src_token, dst_chain_id)
                 .insert(dst_token)) {
          return onlyswap::schema::make_error_result(
              transaction_error_code::token_mapping_already_exists,
              "token mapping already exists");
        }
        chain_.emit("token_mapping_updated",
                    {make_attribute("dst_chain_id", dst_chain_id, true),
                     make_attribute("dst_token", dst_token),
                     make_attribute("src_token", src_token, true)});
        return onlyswap::schema::transaction_result_t{};
      });
}

onlyswap::schema::transaction_result_t router::remove_token_mapping(
    const call_context& context,
    const onlyswap::schema::chain_id_t dst_chain_id,
    const onlyswap::schema::token_id_t& dst_token,
    const onlyswap::schema::token_id_t& src_token) {
  return administer(
      "remove_token_mapping", context, [&](onlyswap::schema::router_state_t&) {
        if (!registry_.is_destination_chain_permitted(dst_chain_id)) {
          return onlyswap::schema::make_error_result(
              transaction_error_code::destination_chain_id_not_supported,
              "destination chain " + std::to_string(dst_chain_id) +
                  " is not permitted");
        }
        if (!registry_.token_mapping(src_token, dst_chain_id)
                 .remove(dst_token)) {
          return onlyswap::schema::make_error_result(
              transaction_error_code::token_not_supported,
              "token mapping does not exist");
        }
        chain_.emit("token_mapping_removed",
                    {make_attribute("dst_chain_id", dst_chain_id, true),
                     make_attribute("dst_token", dst_token),
                     make_attribute("src_token", src_token, true)});
        return onlyswap::schema::transaction_result_t{};
      });
}

onlyswap::schema::transaction_result_t router::withdraw_verification_fee(
    const call_context& context,
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& to) {
  return dispatch(
      "withdraw_verification_fee", context,
      [&](router_logic& logic, settlement_context& settlement) {
        if (!registry_.is_admin(context.caller)) {
          return onlyswap::schema::make_error_result(
              transaction_error_code::access_denied,
              onlyswap::schema::to_hex(context.caller) + " is not an admin");
        }
        return logic.withdraw_verification_fee(settlement, token, to);
      });
}

onlyswap::schema::transaction_result_t router::set_hook_executor(
    const call_context& context,
    const onlyswap::schema::account_id_t& hook_executor) {
  return administer("set_hook_executor", context,
                    [&](onlyswap::schema::router_state_t& router_state) {
                      auto previous = router_state.hook_executor;
                      router_state.hook_executor = hook_executor;
                      registry_.put_router_state(router_state);
                      chain_.emit("hook_executor_updated",
                                  {make_attribute("previous", previous),
                                   make_attribute("hook_executor",
                                                  hook_executor, true)});
                      return onlyswap::schema::transaction_result_t{};
                    });
}

onlyswap::schema::transaction_result_t router::set_permit2_relayer(
    const call_context& context,
    const onlyswap::schema::account_id_t& permit2_relayer) {
  return administer(
      "set_permit2_relayer", context,
      [&](onlyswap::schema::router_state_t& router_state) {
        if (onlyswap::schema::is_zero(permit2_relayer)) {
          return onlyswap::schema::make_error_result(
              transaction_error_code::zero_address,
              "permit relayer is the zero address");
        }
        auto previous = router_state.permit2_relayer;
        router_state.permit2_relayer = permit2_relayer;
        registry_.put_router_state(router_state);
        chain_.emit("permit2_relayer_updated",
                    {make_attribute("previous", previous),
                     make_attribute("permit2_relayer", permit2_relayer, true)});
        return onlyswap::schema::transaction_result_t{};
      });
}

onlyswap::schema::transaction_result_t router::grant_admin_role(
    const call_context& context,
    const onlyswap::schema::account_id_t& account) {
  return administer(
      "grant_admin_role", context, [&](onlyswap::schema::router_state_t&) {
        if (onlyswap::schema::is_zero(account)) {
          return onlyswap::schema::make_error_result(
              transaction_error_code::zero_address,
              "account is the zero address");
        }
        registry_.set_admin(account, true);
        chain_.emit("admin_role_granted",
                    {make_attribute("account", account, true),
                     make_attribute("granted_by", context.caller)});
        return onlyswap::schema::transaction_result_t{};
      });
}

onlyswap::schema::transaction_result_t router::revoke_admin_role(
    const call_context& context,
    const onlyswap::schema::account_id_t& account) {
  return administer(
      "revoke_admin_role", context, [&](onlyswap::schema::router_state_t&) {
        registry_.set_admin(account, false);
        chain_.emit("admin_role_revoked",
                    {make_attribute("account", account, true),
                     make_attribute("revoked_by", context.caller)});
        return onlyswap::schema::transaction_result_t{};
      });
}

std::string router::version() const {
  auto router_state = registry_.router_state();
  if (!router_state) {
    return config_.version;
  }
  auto logic = chain_.implementations().find(router_state->implementation);
  if (!logic) {
    return config_.version;
  }
  return logic->version();
}

bool router::initialized() const {
  return registry_.router_state().has_value();
}

std::optional<onlyswap::schema::swap_request_t>
router::swap_request_parameters(
    const onlyswap::schema::hash32_t& request_id) const {
  return registry_.request(request_id);
}

std::optional<onlyswap::schema::swap_request_receipt_t>
router::swap_request_receipt(
    const onlyswap::schema::hash32_t& request_id) const {
  return registry_.receipt(request_id);
}

onlyswap::schema::swap_request_status_t router::swap_request_status(
    const onlyswap::schema::hash32_t& request_id) const {
  return registry_.status(request_id);
}

onlyswap::schema::amount_t router::total_verification_fee_balance(
    const onlyswap::schema::token_id_t& token) const {
  return registry_.fee_balance(token);
}

fee_split router::verification_fee_amount(
    const onlyswap::schema::amount_t& amount) const {
  return split_verification_fee(amount, verification_fee_bps());
}

uint32_t router::verification_fee_bps() const {
  return current_state().verification_fee_bps;
}

onlyswap::schema::amount_t router::solver_refund_amount(
    const onlyswap::schema::hash32_t& request_id) const {
  return registry_.solver_refund(request_id);
}

std::vector<onlyswap::schema::hash32_t> router::fulfilled_transfers() const {
  return registry_.fulfilled_transfers().values();
}

std::vector<onlyswap::schema::hash32_t> router::fulfilled_solver_refunds()
    const {
  return registry_.fulfilled_solver_refunds().values();
}

std::vector<onlyswap::schema::hash32_t> router::unfulfilled_solver_refunds()
    const {
  return registry_.unfulfilled_solver_refunds().values();
}

std::vector<onlyswap::schema::hash32_t> router::cancelled_swap_requests()
    const {
  return registry_.cancelled_swap_requests().values();
}

onlyswap::schema::timestamp_seconds_t
router::swap_request_cancellation_initiated_at(
    const onlyswap::schema::hash32_t& request_id) const {
  return registry_.cancellation_initiated_at(request_id).value_or(0);
}

bool router::is_destination_chain_id_permitted(
    const onlyswap::schema::chain_id_t chain_id) const {
  return registry_.is_destination_chain_permitted(chain_id);
}

bool router::is_dst_token_mapped(
    const onlyswap::schema::token_id_t& src_token,
    const onlyswap::schema::chain_id_t dst_chain_id,
    const onlyswap::schema::token_id_t& dst_token) const {
  return registry_.token_mapping(src_token, dst_chain_id).contains(dst_token);
}

std::vector<onlyswap::schema::token_id_t> router::token_mapping(
    const onlyswap::schema::token_id_t& src_token,
    const onlyswap::schema::chain_id_t dst_chain_id) const {
  return registry_.token_mapping(src_token, dst_chain_id).values();
}

uint64_t router::current_swap_request_nonce() const {
  return current_state().current_swap_request_nonce;
}

uint64_t router::current_nonce() const {
  return current_state().current_nonce;
}

onlyswap::schema::account_id_t router::swap_request_verifier() const {
  return current_state().swap_request_verifier;
}

onlyswap::schema::account_id_t router::contract_upgrade_verifier() const {
  return current_state().contract_upgrade_verifier;
}

onlyswap::schema::account_id_t router::hook_executor() const {
  return current_state().hook_executor;
}

onlyswap::schema::account_id_t router::permit2_relayer() const {
  return current_state().permit2_relayer;
}

onlyswap::schema::implementation_id_t router::implementation() const {
  return current_state().implementation;
}

std::optional<onlyswap::schema::scheduled_upgrade_t>
router::scheduled_upgrade() const {
  return current_state().scheduled_upgrade;
}

onlyswap::schema::duration_seconds_t router::minimum_contract_upgrade_delay()
    const {
  return current_state().minimum_contract_upgrade_delay;
}

onlyswap::schema::duration_seconds_t router::cancellation_window() const {
  return current_state().cancellation_window;
}

bool router::has_admin_role(
    const onlyswap::schema::account_id_t& account) const {
  return registry_.is_admin(account);
}

std::optional<authorization_message> router::swap_request_parameters_to_bytes(
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::account_id_t& solver) const {
  if (onlyswap::schema::is_zero(solver)) {
    return std::nullopt;
  }
  auto request = registry_.request(request_id);
  if (!request) {
    return std::nullopt;
  }
  return make_authorization_message(kSwapRequestDomainTag,
                                    make_rebalance_message(solver, *request));
}

authorization_message router::contract_upgrade_params_to_bytes(
    const onlyswap::schema::implementation_id_t& new_implementation,
    const onlyswap::schema::bytes_t& init_payload,
    const onlyswap::schema::timestamp_seconds_t upgrade_time) const {
  return make_authorization_message(
      kContractUpgradeDomainTag,
      upgrades_.schedule_upgrade_message(new_implementation, init_payload,
                                         upgrade_time));
}

std::optional<authorization_message> router::cancel_upgrade_params_to_bytes()
    const {
  auto message = upgrades_.cancel_upgrade_message();
  if (message.empty()) {
    return std::nullopt;
  }
  return make_authorization_message(kContractUpgradeDomainTag,
                                    std::move(message));
}

authorization_message router::verifier_update_params_to_bytes(
    const std::string_view action,
    const onlyswap::schema::account_id_t& verifier) const {
  return make_authorization_message(
      kContractUpgradeDomainTag,
      upgrades_.verifier_update_message(action, verifier));
}

authorization_message router::minimum_contract_upgrade_delay_params_to_bytes(
    const onlyswap::schema::duration_seconds_t delay) const {
  return make_authorization_message(
      kContractUpgradeDomainTag,
      upgrades_.duration_update_message(kChangeUpgradeDelayAction, delay));
}

authorization_message router::cancellation_window_params_to_bytes(
    const onlyswap::schema::duration_seconds_t window) const {
  return make_authorization_message(
      kContractUpgradeDomainTag,
      upgrades_.duration_update_message(kChangeCancellationWindowAction,
                                        window));
}

}  // namespace onlyswap::execution
