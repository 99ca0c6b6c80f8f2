#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace onlyswap::common {

/// Log an unrecoverable infrastructure failure and terminate the process.
///
/// Used for storage I/O failures and undecodable persisted values, where
/// continuing would leave the ledger in an unknown state.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace onlyswap::common
