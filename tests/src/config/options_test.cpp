#include <onlyswap/config/node_config.hpp>
#include <onlyswap/testing/common.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

onlyswap::config::options_result parse(std::vector<const char*> args) {
  args.insert(std::begin(args), "onlyswap");
  return onlyswap::config::parse_options(static_cast<int>(args.size()),
                                         args.data());
}

}  // namespace

TEST(options, defaults_describe_a_valid_deployment) {
  auto result = parse({});
  ASSERT_TRUE(result.error.empty()) << result.error;
  EXPECT_FALSE(result.help_requested);
  EXPECT_EQ(result.config.src_chain_id, 1u);
  EXPECT_EQ(result.config.dst_chain_id, 2u);
  EXPECT_EQ(result.config.log_level, "info");
  EXPECT_FALSE(result.config.demo_cancellation);
  EXPECT_EQ(result.config.router.version, "1.0.0");
  EXPECT_EQ(result.config.router.verification_fee_bps, 500u);
  EXPECT_EQ(result.config.router.max_fee_bps, 5000u);
  EXPECT_EQ(result.config.router.minimum_contract_upgrade_delay,
            2 * onlyswap::schema::kSecondsPerDay);
  EXPECT_EQ(result.config.router.cancellation_window,
            onlyswap::schema::kSecondsPerDay);
  EXPECT_FALSE(onlyswap::config::validate(result.config.router).has_value());
}

TEST(options, command_line_overrides_defaults) {
  auto result = parse({"--src-chain-id", "10", "--dst-chain-id", "20",
                       "--router.fee-bps", "250", "--demo-cancellation",
                       "--log-level", "debug"});
  ASSERT_TRUE(result.error.empty()) << result.error;
  EXPECT_EQ(result.config.src_chain_id, 10u);
  EXPECT_EQ(result.config.dst_chain_id, 20u);
  EXPECT_EQ(result.config.router.verification_fee_bps, 250u);
  EXPECT_TRUE(result.config.demo_cancellation);
  EXPECT_EQ(result.config.log_level, "debug");
}

TEST(options, help_is_reported_without_validation) {
  auto result = parse({"--help", "--src-chain-id", "5", "--dst-chain-id", "5"});
  EXPECT_TRUE(result.help_requested);
  EXPECT_TRUE(result.error.empty());
  EXPECT_NE(result.help.find("--router.fee-bps"), std::string::npos);
}

TEST(options, rejects_invalid_values) {
  EXPECT_FALSE(parse({"--src-chain-id", "3", "--dst-chain-id", "3"})
                   .error.empty());
  EXPECT_FALSE(parse({"--log-level", "loud"}).error.empty());
  EXPECT_FALSE(parse({"--amount-in", "0"}).error.empty());
  EXPECT_FALSE(parse({"--solver-fee", "1.5"}).error.empty());
  EXPECT_FALSE(parse({"--router.fee-bps", "0"}).error.empty());
  EXPECT_FALSE(parse({"--router.fee-bps", "6000"}).error.empty());
  EXPECT_FALSE(parse({"--router.upgrade-delay", "3600"}).error.empty());
  EXPECT_FALSE(parse({"--router.cancellation-window", "60"}).error.empty());
  EXPECT_FALSE(parse({"--unknown-flag"}).error.empty());
  EXPECT_FALSE(parse({"--src-chain-id", "not-a-number"}).error.empty());
}

TEST(options, reads_config_file_below_command_line) {
  auto path = onlyswap::testing::make_db_path("onlyswap_options") + ".ini";
  {
    auto file = std::ofstream{path};
    file << "src-chain-id = 7\n"
         << "dst-chain-id = 8\n"
         << "[router]\n"
         << "fee-bps = 100\n"
         << "cancellation-window = 172800\n";
  }

  auto result = parse({"--config", path.c_str(), "--dst-chain-id", "9"});
  ASSERT_TRUE(result.error.empty()) << result.error;
  EXPECT_EQ(result.config.src_chain_id, 7u);
  EXPECT_EQ(result.config.dst_chain_id, 9u);
  EXPECT_EQ(result.config.router.verification_fee_bps, 100u);
  EXPECT_EQ(result.config.router.cancellation_window,
            2 * onlyswap::schema::kSecondsPerDay);
  onlyswap::testing::remove_path(path);

  EXPECT_FALSE(parse({"--config", path.c_str()}).error.empty());
}

TEST(options, router_validation_names_the_problem) {
  auto config = onlyswap::config::router_config{};
  config.version.clear();
  EXPECT_EQ(onlyswap::config::validate(config),
            std::optional<std::string>{"router version must not be empty"});

  config = onlyswap::config::router_config{};
  config.max_fee_bps = 6000;
  EXPECT_TRUE(onlyswap::config::validate(config).has_value());
}
