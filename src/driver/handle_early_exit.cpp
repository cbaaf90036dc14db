/***
 * Name: cargo_rpl::driver::HandleEarlyExit
 * Purpose: Print help or version text, or acknowledge --explain.
 * Inputs:
 *   - decision: router outcome other than Proceed
 *   - out: destination stream
 *   - color: colour help text
 * Outputs:
 *   - int: always 0
 */
#include "cargo_rpl/driver/app.h"

#include <ostream>

#include "cargo_rpl/driver/cli.h"
#include "cargo_rpl/support/log.h"

namespace cargo_rpl::driver {

auto HandleEarlyExit(const router::RouteDecision& decision, std::ostream& out, const bool color) -> int {
  switch (decision.kind) {
    case router::RouteKind::Help:
      PrintHelp(out, color);
      break;
    case router::RouteKind::Version:
      PrintVersion(out);
      break;
    case router::RouteKind::Explain:
      support::Logger::Debug("explain requested for lint `" + decision.lint + "`");
      break;
    case router::RouteKind::Proceed:
      break;
  }
  return 0;
}

}  // namespace cargo_rpl::driver
