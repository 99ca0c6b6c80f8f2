#pragma once

#include <boost/program_options.hpp>
#include <onlyswap/config/router_config.hpp>
#include <onlyswap/schema/primitives.hpp>
#include <string>

namespace onlyswap::config {

/// Settings of the `onlyswap` driver: two ledgers and one demo swap.
struct node_config final {
  onlyswap::schema::chain_id_t src_chain_id{1};
  onlyswap::schema::chain_id_t dst_chain_id{2};
  std::string src_db_path{"onlyswap_src.db"};
  std::string dst_db_path{"onlyswap_dst.db"};
  std::string log_level{"info"};
  std::string log_file{"onlyswap.log"};
  std::string amount_in{"10000000000000000000"};
  std::string amount_out{"9500000000000000000"};
  std::string solver_fee{"1000000000000000000"};
  bool demo_cancellation{false};
  router_config router;
};

struct options_result final {
  node_config config;
  bool help_requested{};
  std::string help;
  std::string error;
};

/// Options bound to the fields of `config`.
boost::program_options::options_description make_options_description(
    node_config& config);

/// Parse the command line and, when `--config` names a file, the INI style
/// file it points to. Command line values take precedence. On failure
/// `error` is set and `config` holds whatever was parsed so far.
options_result parse_options(int argc, const char* const argv[]);

}  // namespace onlyswap::config
