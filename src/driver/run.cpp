/***
 * Name: cargo_rpl::driver::Run
 * Purpose: Route, partition and execute one cargo-rpl command line.
 * Inputs:
 *   - args: full owned argument vector
 *   - resolver: rpl-driver locator
 *   - out: stream for help/version text
 * Outputs:
 *   - int: process exit code
 * Theory of Operation: The argument vector is read, never mutated; the router
 *   sees all of it and the builder sees it without the `cargo-rpl rpl` prefix.
 */
#include "cargo_rpl/driver/app.h"

#include <ostream>
#include <string>
#include <vector>

#include "cargo_rpl/driver/cli.h"
#include "cargo_rpl/exec/command.h"
#include "cargo_rpl/exec/process.h"
#include "cargo_rpl/invocation/invocation.h"
#include "cargo_rpl/support/env.h"

namespace cargo_rpl::driver {

auto Run(const std::vector<std::string>& args, const exec::IExecutableResolver& resolver, std::ostream& out)
    -> int {
  const router::RouteDecision decision = router::Route(args);
  if (decision.kind != router::RouteKind::Proceed) {
    return HandleEarlyExit(decision, out, ShouldColorize(ColorEnv::FromProcess(), StdoutIsTerminal()));
  }
  const invocation::Invocation inv = invocation::BuildInvocation(invocation::StripInvocationPrefix(args));
  const std::string orchestrator = exec::ResolveOrchestrator(support::GetEnv(exec::kOrchestratorEnvVar));
  return exec::RunInvocation(inv, resolver, orchestrator);
}

}  // namespace cargo_rpl::driver
