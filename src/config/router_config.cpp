#include <onlyswap/config/router_config.hpp>
#include <onlyswap/execution/fees.hpp>
#include <onlyswap/execution/upgrade_controller.hpp>

namespace onlyswap::config {

std::optional<std::string> validate(const router_config& config) {
  if (config.version.empty()) {
    return "router version must not be empty";
  }
  if (config.max_fee_bps > onlyswap::execution::kMaxFeeBps) {
    return "max fee bps cannot exceed " +
           std::to_string(onlyswap::execution::kMaxFeeBps);
  }
  if (onlyswap::execution::validate_fee_bps(config.verification_fee_bps,
                                            config.max_fee_bps)) {
    return "verification fee bps must be within 1.." +
           std::to_string(config.max_fee_bps);
  }
  if (config.minimum_contract_upgrade_delay <
      onlyswap::execution::kMinimumContractUpgradeDelayFloor) {
    return "minimum contract upgrade delay must be at least " +
           std::to_string(
               onlyswap::execution::kMinimumContractUpgradeDelayFloor) +
           " seconds";
  }
  if (config.cancellation_window <
      onlyswap::execution::kCancellationWindowFloor) {
    return "cancellation window must be at least " +
           std::to_string(onlyswap::execution::kCancellationWindowFloor) +
           " seconds";
  }
  return std::nullopt;
}

}  // namespace onlyswap::config
