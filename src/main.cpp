#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <onlyswap/config/node_config.hpp>
#include <onlyswap/crypto/verify.hpp>
#include <onlyswap/execution/ledger.hpp>
#include <onlyswap/execution/router.hpp>
#include <onlyswap/execution/settlement_engine.hpp>
#include <onlyswap/execution/signature_verifier.hpp>
#include <onlyswap/execution/token_ledger.hpp>
#include <onlyswap/storage/rocksdb/storage.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

namespace execution = onlyswap::execution;
namespace schema = onlyswap::schema;

struct deployment final {
  schema::account_id_t router;
  schema::account_id_t swap_request_verifier;
  schema::account_id_t contract_upgrade_verifier;
  schema::implementation_id_t implementation;
};

bool require(const schema::transaction_result_t& result,
             const std::string_view step) {
  if (schema::succeeded(result)) {
    return true;
  }
  spdlog::error("{} failed: {} ({})", step, result.log, result.info);
  return false;
}

void deploy(execution::ledger& chain,
            const deployment& addresses,
            const schema::ed25519_signer_id& committee_key,
            const onlyswap::config::router_config& config) {
  chain.verifiers().deploy(
      addresses.swap_request_verifier,
      std::make_shared<execution::ed25519_group_verifier>(
          std::string{execution::kSwapRequestDomainTag}, committee_key));
  chain.verifiers().deploy(
      addresses.contract_upgrade_verifier,
      std::make_shared<execution::ed25519_group_verifier>(
          std::string{execution::kContractUpgradeDomainTag}, committee_key));
  chain.implementations().deploy(
      addresses.implementation,
      std::make_shared<execution::settlement_engine>(config.version));
}

void log_balance(execution::ledger& chain,
                 const std::string_view name,
                 const schema::token_id_t& token,
                 const schema::account_id_t& account) {
  spdlog::info("chain {} balance of {}: {}", chain.chain_id(), name,
               schema::to_string(chain.tokens().balance_of(token, account)));
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = onlyswap::config::parse_options(argc, argv);
  if (options.help_requested) {
    std::cout << options.help << std::endl;
    return 0;
  }
  if (!options.error.empty()) {
    std::cerr << options.error << std::endl << options.help << std::endl;
    return 1;
  }
  const auto& config = options.config;

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "onlyswap", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(config.log_level));

  auto committee = onlyswap::crypto::generate_ed25519_keypair();
  if (!committee) {
    spdlog::error("OpenSSL does not provide ed25519; cannot sign as committee");
    spdlog::shutdown();
    return 1;
  }

  auto src_storage =
      onlyswap::storage::make_storage<onlyswap::storage::rocksdb_storage_tag>(
          config.src_db_path);
  auto dst_storage =
      onlyswap::storage::make_storage<onlyswap::storage::rocksdb_storage_tag>(
          config.dst_db_path);

  auto genesis = static_cast<schema::timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
  auto src_chain = execution::ledger{config.src_chain_id, src_storage, genesis};
  auto dst_chain = execution::ledger{config.dst_chain_id, dst_storage, genesis};

  auto addresses = deployment{
      .router = schema::make_account_id("onlyswap-router"),
      .swap_request_verifier =
          schema::make_account_id("onlyswap-swap-request-verifier"),
      .contract_upgrade_verifier =
          schema::make_account_id("onlyswap-contract-upgrade-verifier"),
      .implementation = schema::make_account_id("settlement-engine-v1")};
  deploy(src_chain, addresses, committee->signer, config.router);
  deploy(dst_chain, addresses, committee->signer, config.router);

  auto src_router =
      execution::router{src_chain, addresses.router, config.router};
  auto dst_router =
      execution::router{dst_chain, addresses.router, config.router};

  auto admin = schema::make_account_id("admin");
  auto requester = schema::make_account_id("requester");
  auto recipient = schema::make_account_id("recipient");
  auto solver = schema::make_account_id("solver");
  auto token_src = schema::make_account_id("token:rusd:src");
  auto token_dst = schema::make_account_id("token:rusd:dst");

  auto admin_call = execution::call_context{.caller = admin};
  for (auto* target : {&src_router, &dst_router}) {
    if (!require(target->initialize(admin_call, admin,
                                    addresses.swap_request_verifier,
                                    addresses.contract_upgrade_verifier,
                                    addresses.implementation),
                 "initialize")) {
      spdlog::shutdown();
      return 1;
    }
  }
  if (!require(src_router.permit_destination_chain_id(admin_call,
                                                      config.dst_chain_id),
               "permit destination chain") ||
      !require(src_router.set_token_mapping(admin_call, config.dst_chain_id,
                                            token_dst, token_src),
               "set token mapping") ||
      !require(dst_router.permit_destination_chain_id(admin_call,
                                                      config.src_chain_id),
               "permit destination chain") ||
      !require(dst_router.set_token_mapping(admin_call, config.src_chain_id,
                                            token_src, token_dst),
               "set token mapping")) {
    spdlog::shutdown();
    return 1;
  }

  auto amount_in = *schema::try_make_amount(config.amount_in);
  auto amount_out = *schema::try_make_amount(config.amount_out);
  auto solver_fee = *schema::try_make_amount(config.solver_fee);
  auto total = schema::amount_t{amount_in + solver_fee};

  auto& src_tokens = src_chain.tokens();
  if (!require(src_tokens.mint(token_src, requester, total), "mint") ||
      !require(src_tokens.approve(token_src, requester, addresses.router,
                                  total),
               "approve")) {
    spdlog::shutdown();
    return 1;
  }

  auto requester_call = execution::call_context{.caller = requester};
  auto swap = schema::request_cross_chain_swap_t{
      .token_in = token_src,
      .token_out = token_dst,
      .amount_in = amount_in,
      .amount_out = amount_out,
      .solver_fee = solver_fee,
      .dst_chain_id = config.dst_chain_id,
      .recipient = recipient,
      .pre_hooks = {},
      .post_hooks = {}};
  auto requested = src_router.request_cross_chain_swap(requester_call, swap);
  if (!require(requested, "request cross chain swap")) {
    spdlog::shutdown();
    return 1;
  }
  auto request_id = schema::make_hash32(requested.data);
  spdlog::info("Request {} is {}", schema::to_hex(request_id),
               schema::to_string(src_router.swap_request_status(request_id)));

  auto ok = true;
  if (config.demo_cancellation) {
    ok = require(src_router.stage_swap_request_cancellation(requester_call,
                                                            request_id),
                 "stage cancellation");
    if (ok) {
      src_chain.advance_time(src_router.cancellation_window());
      ok = require(src_router.cancel_swap_request_and_refund(
                       requester_call, request_id, requester),
                   "cancel and refund");
    }
  } else {
    auto request = *src_router.swap_request_parameters(request_id);
    auto& dst_tokens = dst_chain.tokens();
    ok = require(dst_tokens.mint(token_dst, solver, amount_out), "mint") &&
         require(dst_tokens.approve(token_dst, solver, addresses.router,
                                    amount_out),
                 "approve");

    auto solver_call = execution::call_context{.caller = solver};
    if (ok) {
      auto relay = schema::relay_tokens_t{
          .solver_refund_address = solver,
          .request_id = request_id,
          .sender = request.sender,
          .recipient = request.recipient,
          .token_in = request.token_in,
          .token_out = request.token_out,
          .amount_out = request.amount_out,
          .src_chain_id = request.src_chain_id,
          .nonce = request.nonce,
          .pre_hooks = request.pre_hooks,
          .post_hooks = request.post_hooks};
      ok = require(dst_router.relay_tokens(solver_call, relay), "relay tokens");
    }
    if (ok) {
      auto authorization =
          *src_router.swap_request_parameters_to_bytes(request_id, solver);
      auto signature = onlyswap::crypto::sign_ed25519(
          committee->private_key,
          schema::bytes_view_t{authorization.digest.data(),
                               authorization.digest.size()});
      ok = signature.has_value() &&
           require(src_router.rebalance_solver(
                       solver_call, solver, request_id,
                       schema::bytes_t{std::begin(*signature),
                                       std::end(*signature)}),
                   "rebalance solver");
    }
  }

  spdlog::info("Request {} is {}", schema::to_hex(request_id),
               schema::to_string(src_router.swap_request_status(request_id)));
  log_balance(src_chain, "requester", token_src, requester);
  log_balance(src_chain, "solver", token_src, solver);
  log_balance(src_chain, "router", token_src, addresses.router);
  log_balance(dst_chain, "recipient", token_dst, recipient);
  spdlog::info("Verification fees held: {}",
               schema::to_string(
                   src_router.total_verification_fee_balance(token_src)));

  if (ok) {
    auto src_committed = src_chain.commit();
    auto dst_committed = dst_chain.commit();
    spdlog::info("Committed chain {} at sequence {} with root {}",
                 src_chain.chain_id(), src_committed.sequence,
                 schema::to_hex(src_committed.state_root));
    spdlog::info("Committed chain {} at sequence {} with root {}",
                 dst_chain.chain_id(), dst_committed.sequence,
                 schema::to_hex(dst_committed.state_root));
  }

  spdlog::shutdown();
  return ok ? 0 : 1;
}
