/***
 * Name: cargo_rpl::support::Logger::DebugEnabled
 * Purpose: Report whether debug lines should be written.
 * Inputs: CARGO_RPL_LOG (read once, unless EnableDebug was called first)
 * Outputs: true when debug logging is on
 * Theory of Operation: Accepts the usual truthy spellings plus "debug".
 */
#include "cargo_rpl/support/log.h"

#include "cargo_rpl/support/env.h"

namespace cargo_rpl::support {

auto Logger::DebugEnabled() -> bool {
  if (!state_.configured) {
    const auto value = GetEnv("CARGO_RPL_LOG");
    state_.debug = value.has_value() && (IsTrueValue(*value) || EqualsIgnoreCase(*value, "debug"));
    state_.configured = true;
  }
  return state_.debug;
}

}  // namespace cargo_rpl::support
