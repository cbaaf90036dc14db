/***
 * Name: cargo_rpl::exec::BuildCommand
 * Purpose: Assemble the cargo command for an Invocation.
 * Inputs:
 *   - inv: partitioned invocation
 *   - resolver: source of the rpl-driver path
 *   - orchestrator: cargo program name or path
 * Outputs:
 *   - Command: program, [subcommand, cargo args...], wrapper environment
 * Theory of Operation: RUSTC_WORKSPACE_WRAPPER routes workspace crates through
 *   rpl-driver; RPL_ARGS carries the driver's own arguments.
 */
#include "cargo_rpl/exec/command.h"

#include <string>

#include "cargo_rpl/exec/analysis_args.h"

namespace cargo_rpl::exec {

auto BuildCommand(const invocation::Invocation& inv,
                  const IExecutableResolver& resolver,
                  const std::string& orchestrator) -> Command {
  Command command;
  command.program = orchestrator;
  command.args.reserve(inv.orchestrator_args.size() + 1U);
  command.args.emplace_back(invocation::SubcommandName(inv.subcommand));
  command.args.insert(command.args.end(), inv.orchestrator_args.begin(), inv.orchestrator_args.end());
  command.env.emplace_back(kWrapperEnvVar, resolver.AnalysisToolPath());
  command.env.emplace_back(kArgsEnvVar, EncodeAnalysisArgs(inv.analysis_args));
  return command;
}

}  // namespace cargo_rpl::exec
