#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace strongbox::common {

/// Log an unrecoverable ledger fault and terminate the process.
///
/// Reserved for broken invariants of the persistence layer (corrupt rows,
/// failed batch writes). Caller-recoverable conditions are reported through
/// `operation_result_t` instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace strongbox::common
