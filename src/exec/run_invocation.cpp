/***
 * Name: cargo_rpl::exec::RunInvocation
 * Purpose: Execute one Invocation end to end.
 * Inputs:
 *   - inv: partitioned invocation
 *   - resolver: rpl-driver locator
 *   - orchestrator: cargo program
 * Outputs:
 *   - int: exit code to return from main()
 * Theory of Operation: Exactly one child, no retries; LaunchError propagates.
 */
#include "cargo_rpl/exec/process.h"

#include <string>

#include "cargo_rpl/support/log.h"

namespace cargo_rpl::exec {

auto RunInvocation(const invocation::Invocation& inv,
                   const IExecutableResolver& resolver,
                   const std::string& orchestrator) -> int {
  const Command command = BuildCommand(inv, resolver, orchestrator);
  support::Logger::Debug("running: " + RenderCommand(command));
  const ExitStatus status = SpawnAndWait(command);
  if (!status.exited) {
    support::Logger::Debug(command.program + " terminated by signal " + std::to_string(status.signal));
  } else if (status.code != 0) {
    support::Logger::Debug(command.program + " exited with status " + std::to_string(status.code));
  }
  return PropagatedExitCode(status);
}

}  // namespace cargo_rpl::exec
