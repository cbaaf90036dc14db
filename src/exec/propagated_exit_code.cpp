/***
 * Name: cargo_rpl::exec::PropagatedExitCode
 * Purpose: Map the child's termination status to cargo-rpl's own exit code.
 * Inputs: status
 * Outputs: 0 on success; the child's exit code; kAbnormalExitCode when killed
 */
#include "cargo_rpl/exec/process.h"

namespace cargo_rpl::exec {

auto PropagatedExitCode(const ExitStatus& status) -> int {
  if (!status.exited) {
    return kAbnormalExitCode;
  }
  return status.code;
}

}  // namespace cargo_rpl::exec
