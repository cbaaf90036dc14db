/***
 * Name: cargo_rpl::exec::ResolveOrchestrator
 * Purpose: Pick the cargo executable to run.
 * Inputs:
 *   - env_value: value of $CARGO, if set
 * Outputs: Program name or path handed to execvp
 * Theory of Operation: Cargo exports CARGO to its subcommands, so the same
 *   toolchain's cargo is reused; an empty value falls back to "cargo".
 */
#include "cargo_rpl/exec/command.h"

#include <optional>
#include <string>

#include "cargo_rpl/support/log.h"

namespace cargo_rpl::exec {

auto ResolveOrchestrator(const std::optional<std::string>& env_value) -> std::string {
  if (!env_value.has_value()) {
    return kDefaultOrchestrator;
  }
  if (env_value->empty()) {
    support::Logger::Warn(std::string(kOrchestratorEnvVar) + " is set but empty; using `" +
                          kDefaultOrchestrator + "`");
    return kDefaultOrchestrator;
  }
  return *env_value;
}

}  // namespace cargo_rpl::exec
