/***
 * Name: cargo_rpl::exec (process)
 * Purpose: Spawn the orchestrator, wait for it, and map its status to an exit code.
 * Inputs: Command
 * Outputs: ExitStatus / process exit code
 * Theory of Operation: POSIX fork/exec/wait. The child reports exec failures
 *   through a close-on-exec pipe, so "could not start" is a LaunchError rather
 *   than an exit code that happens to be 127.
 */
#pragma once

#include <string>

#include "cargo_rpl/exec/command.h"
#include "cargo_rpl/exec/resolver.h"
#include "cargo_rpl/invocation/invocation.h"

namespace cargo_rpl {
namespace exec {

inline constexpr int kAbnormalExitCode = -1;

/***
 * Name: cargo_rpl::exec::ExitStatus
 * Purpose: Termination status of the awaited child.
 * Inputs: Populated by SpawnAndWait.
 * Outputs: exited + code for normal exits; signal when killed.
 */
struct ExitStatus {
  bool exited = false;
  int code = kAbnormalExitCode;
  int signal = 0;
};

/*** SpawnAndWait: Run the command to completion; throws LaunchError if it cannot start. */
ExitStatus SpawnAndWait(const Command& command);

/*** PropagatedExitCode: 0 on success, the child's code on failure, -1 if unavailable. */
int PropagatedExitCode(const ExitStatus& status);

/*** RunInvocation: BuildCommand, SpawnAndWait, PropagatedExitCode. */
int RunInvocation(const invocation::Invocation& inv,
                  const IExecutableResolver& resolver,
                  const std::string& orchestrator);

}  // namespace exec
}  // namespace cargo_rpl
