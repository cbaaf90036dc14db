/***
 * Name: cargo_rpl::router::Route
 * Purpose: Classify a command line into an early exit or a normal run.
 * Inputs:
 *   - args: full owned argument vector
 * Outputs:
 *   - RouteDecision
 * Theory of Operation:
 *   Three independent passes in precedence order, mirroring how cargo
 *   subcommands treat global flags: any help flag wins, then any version
 *   flag, then the first --explain. Only --explain looks at a neighbour.
 */
#include "cargo_rpl/router/router.h"

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

#include "cargo_rpl/support/env.h"

namespace cargo_rpl::router {

auto Route(const std::vector<std::string>& args) -> RouteDecision {
  RouteDecision decision;
  if (std::any_of(args.begin(), args.end(), IsHelpFlag)) {
    decision.kind = RouteKind::Help;
    return decision;
  }
  if (std::any_of(args.begin(), args.end(), IsVersionFlag)) {
    decision.kind = RouteKind::Version;
    return decision;
  }
  const auto explain = std::find(args.begin(), args.end(), "--explain");
  if (explain == args.end()) {
    return decision;
  }
  const auto lint = std::next(explain);
  if (lint == args.end()) {
    decision.kind = RouteKind::Help;
    return decision;
  }
  decision.kind = RouteKind::Explain;
  decision.lint = support::AsciiLower(*lint);
  return decision;
}

}  // namespace cargo_rpl::router
