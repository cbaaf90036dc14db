/***
 * Name: cargo_rpl::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: Owned argument vector, executable resolver, output stream
 * Outputs: Process exit code
 * Theory of Operation: Keep main() minimal: it captures argv and supplies the
 *   platform resolver; RunMain reports exceptions and Run does the rest.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "cargo_rpl/exec/resolver.h"
#include "cargo_rpl/router/router.h"

namespace cargo_rpl {
namespace driver {

inline constexpr int kAbortExitCode = 101;

/***
 * Name: cargo_rpl::driver::HandleEarlyExit
 * Purpose: Act on a Help, Version or Explain decision.
 * Inputs: decision (kind != Proceed), out (stdout), color
 * Outputs: Exit code 0
 * Theory of Operation: Explain only normalizes the lint name; the lookup itself
 *   belongs to rpl-driver, so nothing is printed for it.
 */
int HandleEarlyExit(const router::RouteDecision& decision, std::ostream& out, bool color);

/***
 * Name: cargo_rpl::driver::Run
 * Purpose: Execute one cargo-rpl command line.
 * Inputs:
 *   - args: full owned argument vector (program name first)
 *   - resolver: rpl-driver locator
 *   - out: stream for help/version text
 * Outputs: Exit code (0, cargo's code, or -1)
 * Theory of Operation: Route; on Proceed strip the `rpl` prefix, build the
 *   Invocation, resolve $CARGO and run. Exceptions propagate to main().
 */
int Run(const std::vector<std::string>& args, const exec::IExecutableResolver& resolver, std::ostream& out);

/*** RunMain: Run, with fatal errors logged and mapped to kAbortExitCode. */
int RunMain(const std::vector<std::string>& args, const exec::IExecutableResolver& resolver, std::ostream& out);

}  // namespace driver
}  // namespace cargo_rpl
