#include <onlyswap/execution/fees.hpp>
#include <onlyswap/execution/hook_gateway.hpp>
#include <onlyswap/execution/messages.hpp>
#include <onlyswap/execution/permit_relayer.hpp>
#include <onlyswap/execution/settlement_engine.hpp>
#include <onlyswap/execution/signature_verifier.hpp>
#include <onlyswap/execution/token_ledger.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace onlyswap::execution {

namespace {

using onlyswap::schema::transaction_error_code;

using error_result_t = std::optional<onlyswap::schema::transaction_result_t>;

onlyswap::schema::transaction_result_t make_not_initialized() {
  return onlyswap::schema::make_error_result(
      transaction_error_code::not_initialized, "router is not initialized");
}

onlyswap::schema::transaction_result_t make_amount_overflow(
    const std::string& log) {
  return onlyswap::schema::make_error_result(
      transaction_error_code::amount_overflow, log);
}

onlyswap::schema::transaction_result_t make_id_result(
    const onlyswap::schema::hash32_t& request_id) {
  auto result = onlyswap::schema::transaction_result_t{};
  result.data = onlyswap::schema::bytes_t{std::begin(request_id),
                                          std::end(request_id)};
  return result;
}

error_result_t validate_swap(const settlement_context& context,
                             const onlyswap::schema::request_cross_chain_swap_t& swap) {
  if (swap.amount_in == 0 || swap.amount_out == 0) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_amount,
        "amount_in and amount_out must be positive");
  }
  if (swap.solver_fee == 0) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::fee_too_low, "solver fee must be positive");
  }
  if (onlyswap::schema::is_zero(swap.recipient)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address, "recipient is the zero address");
  }
  if (onlyswap::schema::is_zero(swap.token_in) ||
      onlyswap::schema::is_zero(swap.token_out)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::invalid_token_or_recipient,
        "token_in and token_out must be set");
  }
  if (!context.registry.is_destination_chain_permitted(swap.dst_chain_id)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::destination_chain_id_not_supported,
        "destination chain " + std::to_string(swap.dst_chain_id) +
            " is not permitted");
  }
  if (!context.registry.token_mapping(swap.token_in, swap.dst_chain_id)
           .contains(swap.token_out)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::token_not_supported,
        "token pair is not mapped for destination chain " +
            std::to_string(swap.dst_chain_id));
  }
  if (swap.dst_chain_id == context.chain.chain_id()) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::
            source_chain_id_should_be_different_from_destination,
        "destination chain equals the local chain");
  }
  return std::nullopt;
}

onlyswap::schema::transaction_result_t run_hooks(
    settlement_context& context,
    const onlyswap::schema::router_state_t& router_state,
    const onlyswap::schema::hooks_t& hooks) {
  if (hooks.empty()) {
    return {};
  }
  auto gateway = context.chain.hook_gateways().find(router_state.hook_executor);
  if (!gateway) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::hook_executor_not_set,
        "hooks supplied but no hook executor is configured");
  }
  return gateway->execute(context.chain,
                          call_context{.caller = context.registry.router()},
                          hooks);
}

std::shared_ptr<permit_relayer> find_permit_relayer(
    settlement_context& context,
    const onlyswap::schema::router_state_t& router_state) {
  return context.chain.permit_relayers().find(router_state.permit2_relayer);
}

onlyswap::schema::transaction_result_t make_relayer_not_set() {
  return onlyswap::schema::make_error_result(
      transaction_error_code::permit2_relayer_not_set,
      "no permit relayer is configured");
}

/// Record a validated request, run its pre-hooks and take custody through
/// `collect(total)`.
template <typename Collect>
onlyswap::schema::transaction_result_t create_request(
    settlement_context& context,
    onlyswap::schema::router_state_t router_state,
    const onlyswap::schema::request_cross_chain_swap_t& swap,
    const onlyswap::schema::account_id_t& sender,
    Collect&& collect) {
  auto& registry = context.registry;
  auto split =
      split_verification_fee(swap.amount_in, router_state.verification_fee_bps);
  auto total = onlyswap::schema::try_add(swap.amount_in, swap.solver_fee);
  auto refund = solver_refund_amount(swap.amount_in, split.verification_fee,
                                     swap.solver_fee);
  auto fee_balance = onlyswap::schema::try_add(
      registry.fee_balance(swap.token_in), split.verification_fee);
  if (!total || !refund || !fee_balance) {
    return make_amount_overflow("request amounts exceed 256 bits");
  }

  router_state.current_swap_request_nonce += 1;
  registry.put_router_state(router_state);

  auto request = onlyswap::schema::swap_request_t{
      .sender = sender,
      .recipient = swap.recipient,
      .token_in = swap.token_in,
      .token_out = swap.token_out,
      .amount_in = swap.amount_in,
      .amount_out = swap.amount_out,
      .src_chain_id = context.chain.chain_id(),
      .dst_chain_id = swap.dst_chain_id,
      .verification_fee = split.verification_fee,
      .solver_fee = swap.solver_fee,
      .nonce = router_state.current_swap_request_nonce,
      .executed = false,
      .requested_at = context.chain.now(),
      .pre_hooks = swap.pre_hooks,
      .post_hooks = swap.post_hooks};
  auto request_id = make_request_id(request);

  registry.put_request(request_id, request);
  registry.unfulfilled_solver_refunds().insert(request_id);
  registry.set_solver_refund(request_id, *refund);
  registry.set_fee_balance(swap.token_in, *fee_balance);

  auto hooks = run_hooks(context, router_state, swap.pre_hooks);
  if (!onlyswap::schema::succeeded(hooks)) {
    return hooks;
  }
  auto custody = std::forward<Collect>(collect)(*total);
  if (!onlyswap::schema::succeeded(custody)) {
    return custody;
  }

  context.chain.emit(
      "swap_request_created",
      {make_attribute("request_id", request_id, true),
       make_attribute("sender", request.sender, true),
       make_attribute("recipient", request.recipient),
       make_attribute("token_in", request.token_in),
       make_attribute("token_out", request.token_out),
       make_attribute("amount_in", request.amount_in),
       make_attribute("amount_out", request.amount_out),
       make_attribute("src_chain_id", request.src_chain_id),
       make_attribute("dst_chain_id", request.dst_chain_id, true),
       make_attribute("nonce", request.nonce),
       make_attribute("verification_fee", request.verification_fee),
       make_attribute("solver_fee", request.solver_fee),
       make_attribute("requested_at", request.requested_at)});
  spdlog::info("Swap request {} created by {} on chain {} for chain {}",
               onlyswap::schema::to_hex(request_id),
               onlyswap::schema::to_hex(sender), request.src_chain_id,
               request.dst_chain_id);

  auto result = make_id_result(request_id);
  result.gas_used = hooks.gas_used;
  return result;
}

/// Checks shared by both fulfillment paths, in order.
error_result_t validate_relay(settlement_context& context,
                              const onlyswap::schema::router_state_t& router_state,
                              const onlyswap::schema::relay_tokens_t& relay) {
  if (context.registry.fulfilled_transfers().contains(relay.request_id)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::already_fulfilled,
        "request " + onlyswap::schema::to_hex(relay.request_id) +
            " already fulfilled");
  }
  if (onlyswap::schema::is_zero(relay.solver_refund_address)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address,
        "solver refund address is the zero address");
  }
  if (onlyswap::schema::is_zero(relay.recipient) ||
      onlyswap::schema::is_zero(relay.token_in) ||
      onlyswap::schema::is_zero(relay.token_out)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::invalid_token_or_recipient,
        "recipient and tokens must be set");
  }
  if (relay.amount_out == 0) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_amount, "amount_out must be positive");
  }
  if (relay.src_chain_id == context.chain.chain_id()) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::
            source_chain_id_should_be_different_from_destination,
        "source chain equals the local chain");
  }
  auto expected = make_request_id(
      relay.sender, relay.recipient, relay.token_in, relay.token_out,
      relay.amount_out, relay.src_chain_id, context.chain.chain_id(),
      relay.nonce, relay.pre_hooks, relay.post_hooks);
  if (expected != relay.request_id) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::swap_request_parameters_mismatch,
        "request id does not match the supplied parameters");
  }
  if (!relay.post_hooks.empty() &&
      !context.chain.hook_gateways().contains(router_state.hook_executor)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::hook_executor_not_set,
        "post hooks supplied but no hook executor is configured");
  }
  return std::nullopt;
}

/// Mark the id fulfilled and write the receipt, then deliver through
/// `deliver()` and run the post-hooks.
template <typename Deliver>
onlyswap::schema::transaction_result_t fulfill(
    settlement_context& context,
    const onlyswap::schema::router_state_t& router_state,
    const onlyswap::schema::relay_tokens_t& relay,
    Deliver&& deliver) {
  auto& registry = context.registry;
  registry.fulfilled_transfers().insert(relay.request_id);
  registry.put_receipt(onlyswap::schema::swap_request_receipt_t{
      .request_id = relay.request_id,
      .src_chain_id = relay.src_chain_id,
      .dst_chain_id = context.chain.chain_id(),
      .token_in = relay.token_in,
      .token_out = relay.token_out,
      .fulfilled = true,
      .solver = relay.solver_refund_address,
      .recipient = relay.recipient,
      .amount_out = relay.amount_out,
      .fulfilled_at = context.chain.now()});

  auto delivered = std::forward<Deliver>(deliver)();
  if (!onlyswap::schema::succeeded(delivered)) {
    return delivered;
  }
  auto hooks = run_hooks(context, router_state, relay.post_hooks);
  if (!onlyswap::schema::succeeded(hooks)) {
    return hooks;
  }

  context.chain.emit(
      "swap_request_fulfilled",
      {make_attribute("request_id", relay.request_id, true),
       make_attribute("src_chain_id", relay.src_chain_id),
       make_attribute("dst_chain_id", context.chain.chain_id()),
       make_attribute("token_in", relay.token_in),
       make_attribute("token_out", relay.token_out),
       make_attribute("solver", relay.solver_refund_address, true),
       make_attribute("recipient", relay.recipient),
       make_attribute("amount_out", relay.amount_out),
       make_attribute("fulfilled_at", context.chain.now())});
  spdlog::info("Swap request {} fulfilled on chain {} for solver {}",
               onlyswap::schema::to_hex(relay.request_id),
               context.chain.chain_id(),
               onlyswap::schema::to_hex(relay.solver_refund_address));

  auto result = make_id_result(relay.request_id);
  result.gas_used = hooks.gas_used;
  return result;
}

/// Terminal transition of an unexecuted request: flag it executed, drop its
/// hooks and its refund entry. Returns the refund that was owed.
onlyswap::schema::amount_t close_request(
    swap_request_registry& registry,
    const onlyswap::schema::hash32_t& request_id,
    onlyswap::schema::swap_request_t request) {
  request.executed = true;
  request.pre_hooks.clear();
  request.post_hooks.clear();
  registry.put_request(request_id, request);
  registry.unfulfilled_solver_refunds().remove(request_id);

  auto refund = registry.solver_refund(request_id);
  registry.erase_solver_refund(request_id);
  return refund;
}

}  // namespace

settlement_engine::settlement_engine(std::string version)
    : version_{std::move(version)} {}

std::string settlement_engine::version() const {
  return version_;
}

onlyswap::schema::transaction_result_t settlement_engine::on_upgrade(
    settlement_context& context,
    const onlyswap::schema::bytes_t& init_payload) {
  spdlog::info("Router {} now runs settlement engine {} ({} byte payload)",
               onlyswap::schema::to_hex(context.registry.router()), version_,
               init_payload.size());
  return {};
}

onlyswap::schema::transaction_result_t
settlement_engine::request_cross_chain_swap(
    settlement_context& context,
    const onlyswap::schema::request_cross_chain_swap_t& swap) {
  auto router_state = context.registry.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (auto error = validate_swap(context, swap)) {
    return *error;
  }
  const auto& router = context.registry.router();
  const auto& caller = context.call.caller;
  return create_request(
      context, *router_state, swap, caller,
      [&](const onlyswap::schema::amount_t& total) {
        return context.chain.tokens().transfer_from(swap.token_in, router,
                                                    caller, router, total);
      });
}

onlyswap::schema::transaction_result_t
settlement_engine::request_cross_chain_swap_permit2(
    settlement_context& context,
    const onlyswap::schema::request_cross_chain_swap_permit2_t& swap) {
  auto router_state = context.registry.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (auto error = validate_swap(context, swap.swap)) {
    return *error;
  }
  if (onlyswap::schema::is_zero(swap.requester)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address, "requester is the zero address");
  }
  if (swap.permit.token != swap.swap.token_in) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::permit_invalid,
        "permit token differs from token_in");
  }
  auto relayer = find_permit_relayer(context, *router_state);
  if (!relayer) {
    return make_relayer_not_set();
  }

  const auto& router = context.registry.router();
  auto witness =
      make_swap_request_witness(router, swap.swap, swap.additional_data);
  return create_request(
      context, *router_state, swap.swap, swap.requester,
      [&](const onlyswap::schema::amount_t& total) {
        return relayer->permit_witness_transfer_from(
            context.chain, call_context{.caller = router}, swap.requester,
            swap.permit, router, total, witness, swap.signature);
      });
}

onlyswap::schema::transaction_result_t
settlement_engine::update_solver_fees_if_unfulfilled(
    settlement_context& context,
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::amount_t& new_fee) {
  auto& registry = context.registry;
  auto request = registry.request(request_id);
  if (!request || request->sender != context.call.caller) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::unauthorised_caller,
        "only the request sender may update the solver fee");
  }
  if (request->executed) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::already_fulfilled,
        "request already executed");
  }
  if (new_fee <= request->solver_fee) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::new_fee_too_low,
        "new solver fee must exceed " +
            onlyswap::schema::to_string(request->solver_fee));
  }

  auto delta = onlyswap::schema::amount_t{new_fee - request->solver_fee};
  auto refund = onlyswap::schema::try_add(registry.solver_refund(request_id),
                                          delta);
  if (!refund ||
      !onlyswap::schema::try_add(request->amount_in, new_fee).has_value()) {
    return make_amount_overflow("solver fee exceeds 256 bits");
  }
  auto old_fee = request->solver_fee;
  request->solver_fee = new_fee;
  registry.put_request(request_id, *request);
  registry.set_solver_refund(request_id, *refund);

  const auto& router = registry.router();
  auto moved = context.chain.tokens().transfer_from(
      request->token_in, router, context.call.caller, router, delta);
  if (!onlyswap::schema::succeeded(moved)) {
    return moved;
  }

  context.chain.emit("swap_request_solver_fee_updated",
                     {make_attribute("request_id", request_id, true),
                      make_attribute("old_fee", old_fee),
                      make_attribute("new_fee", new_fee)});
  return make_id_result(request_id);
}

onlyswap::schema::transaction_result_t settlement_engine::relay_tokens(
    settlement_context& context,
    const onlyswap::schema::relay_tokens_t& relay) {
  auto router_state = context.registry.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (auto error = validate_relay(context, *router_state, relay)) {
    return *error;
  }
  const auto& router = context.registry.router();
  const auto& solver = context.call.caller;
  return fulfill(context, *router_state, relay, [&]() {
    return context.chain.tokens().transfer_from(relay.token_out, router, solver,
                                                relay.recipient,
                                                relay.amount_out);
  });
}

onlyswap::schema::transaction_result_t settlement_engine::relay_tokens_permit2(
    settlement_context& context,
    const onlyswap::schema::relay_tokens_permit2_t& relay) {
  auto router_state = context.registry.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (auto error = validate_relay(context, *router_state, relay.relay)) {
    return *error;
  }
  if (relay.permit.token != relay.relay.token_out) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::permit_invalid,
        "permit token differs from token_out");
  }
  auto relayer = find_permit_relayer(context, *router_state);
  if (!relayer) {
    return make_relayer_not_set();
  }

  const auto& router = context.registry.router();
  auto witness = make_relay_witness(
      relay.relay.request_id, relay.relay.recipient,
      make_solver_refund_payload(relay.relay.solver_refund_address));
  return fulfill(context, *router_state, relay.relay, [&]() {
    return relayer->permit_witness_transfer_from(
        context.chain, call_context{.caller = router}, relay.solver,
        relay.permit, relay.relay.recipient, relay.relay.amount_out, witness,
        relay.signature);
  });
}

onlyswap::schema::transaction_result_t settlement_engine::rebalance_solver(
    settlement_context& context,
    const onlyswap::schema::account_id_t& solver,
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::bytes_t& signature) {
  auto& registry = context.registry;
  auto router_state = registry.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  auto request = registry.request(request_id);
  if (request && request->executed) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::already_fulfilled,
        "request " + onlyswap::schema::to_hex(request_id) +
            " already executed");
  }
  if (!request || request->src_chain_id != context.chain.chain_id()) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::source_chain_id_mismatch,
        "request was not created on chain " +
            std::to_string(context.chain.chain_id()));
  }
  if (onlyswap::schema::is_zero(solver)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address, "solver is the zero address");
  }
  auto verifier =
      context.chain.verifiers().find(router_state->swap_request_verifier);
  if (!verifier) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::verifier_not_found,
        "swap request verifier is not deployed");
  }
  auto message = make_rebalance_message(solver, *request);
  if (!verifier->verify(onlyswap::schema::make_bytes_view(message),
                        onlyswap::schema::bytes_view_t{signature})) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::signature_verification_failed,
        "rebalance signature rejected");
  }

  auto token_in = request->token_in;
  auto refund = close_request(registry, request_id, std::move(*request));
  registry.fulfilled_solver_refunds().insert(request_id);

  auto paid = context.chain.tokens().transfer(token_in, registry.router(),
                                              solver, refund);
  if (!onlyswap::schema::succeeded(paid)) {
    return paid;
  }

  context.chain.emit("solver_rebalanced",
                     {make_attribute("request_id", request_id, true),
                      make_attribute("solver", solver, true),
                      make_attribute("token", token_in),
                      make_attribute("amount", refund)});
  spdlog::info("Solver {} repaid {} for request {}",
               onlyswap::schema::to_hex(solver),
               onlyswap::schema::to_string(refund),
               onlyswap::schema::to_hex(request_id));
  return make_id_result(request_id);
}

onlyswap::schema::transaction_result_t
settlement_engine::stage_swap_request_cancellation(
    settlement_context& context,
    const onlyswap::schema::hash32_t& request_id) {
  auto& registry = context.registry;
  auto request = registry.request(request_id);
  if (!request || request->sender != context.call.caller) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::unauthorised_caller,
        "only the request sender may stage a cancellation");
  }
  if (request->executed) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::already_fulfilled,
        "request already executed");
  }
  if (registry.cancellation_initiated_at(request_id).has_value()) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::swap_request_cancellation_already_staged,
        "cancellation already staged");
  }

  auto now = context.chain.now();
  registry.set_cancellation_initiated_at(request_id, now);
  context.chain.emit("swap_request_cancellation_staged",
                     {make_attribute("request_id", request_id, true),
                      make_attribute("sender", request->sender, true),
                      make_attribute("staged_at", now)});
  return make_id_result(request_id);
}

onlyswap::schema::transaction_result_t
settlement_engine::cancel_swap_request_and_refund(
    settlement_context& context,
    const onlyswap::schema::hash32_t& request_id,
    const onlyswap::schema::account_id_t& refund_recipient) {
  auto& registry = context.registry;
  auto router_state = registry.router_state();
  if (!router_state) {
    return make_not_initialized();
  }
  if (onlyswap::schema::is_zero(refund_recipient)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address,
        "refund recipient is the zero address");
  }
  auto request = registry.request(request_id);
  if (!request || request->sender != context.call.caller) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::unauthorised_caller,
        "only the request sender may cancel");
  }
  if (request->executed) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::already_fulfilled,
        "request already executed");
  }
  auto staged_at = registry.cancellation_initiated_at(request_id);
  if (!staged_at) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::swap_request_cancellation_not_staged,
        "cancellation was not staged");
  }
  auto now = context.chain.now();
  if (now < *staged_at + router_state->cancellation_window) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::swap_request_cancellation_window_not_passed,
        "cancellation window ends at " +
            std::to_string(*staged_at + router_state->cancellation_window));
  }
  auto fee_balance = registry.fee_balance(request->token_in);
  if (fee_balance < request->verification_fee) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::insufficient_verification_fee_balance,
        "fee balance " + onlyswap::schema::to_string(fee_balance) +
            " below reserved fee " +
            onlyswap::schema::to_string(request->verification_fee));
  }

  auto token_in = request->token_in;
  auto verification_fee = request->verification_fee;
  auto refund = close_request(registry, request_id, std::move(*request));
  registry.cancelled_swap_requests().insert(request_id);
  registry.set_fee_balance(
      token_in, onlyswap::schema::amount_t{fee_balance - verification_fee});

  auto total = onlyswap::schema::amount_t{refund + verification_fee};
  auto paid = context.chain.tokens().transfer(token_in, registry.router(),
                                              refund_recipient, total);
  if (!onlyswap::schema::succeeded(paid)) {
    return paid;
  }

  context.chain.emit("swap_request_refund_claimed",
                     {make_attribute("request_id", request_id, true),
                      make_attribute("recipient", refund_recipient, true),
                      make_attribute("token", token_in),
                      make_attribute("amount", total)});
  spdlog::info("Swap request {} cancelled, {} refunded",
               onlyswap::schema::to_hex(request_id),
               onlyswap::schema::to_string(total));
  return make_id_result(request_id);
}

onlyswap::schema::transaction_result_t
settlement_engine::withdraw_verification_fee(
    settlement_context& context,
    const onlyswap::schema::token_id_t& token,
    const onlyswap::schema::account_id_t& to) {
  if (onlyswap::schema::is_zero(to)) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_address, "recipient is the zero address");
  }
  auto& registry = context.registry;
  auto balance = registry.fee_balance(token);
  if (balance == 0) {
    return onlyswap::schema::make_error_result(
        transaction_error_code::zero_amount, "no verification fees to withdraw");
  }
  registry.set_fee_balance(token, onlyswap::schema::amount_t{0});

  auto paid =
      context.chain.tokens().transfer(token, registry.router(), to, balance);
  if (!onlyswap::schema::succeeded(paid)) {
    return paid;
  }
  context.chain.emit("verification_fee_withdrawn",
                     {make_attribute("token", token, true),
                      make_attribute("to", to, true),
                      make_attribute("amount", balance)});
  return {};
}

}  // namespace onlyswap::execution
