/***
 * Name: cargo_rpl::router
 * Purpose: Classify the raw command line into early-exit requests or a normal run.
 * Inputs: The full owned argument vector (program name included)
 * Outputs: RouteDecision
 * Theory of Operation: Global flags are recognized anywhere in the list, in a fixed
 *   precedence: help, then version, then explain. Nothing is printed here; the
 *   driver acts on the decision.
 */
#pragma once

#include <string>
#include <vector>

namespace cargo_rpl {
namespace router {

enum class RouteKind { Proceed, Help, Version, Explain };

/***
 * Name: cargo_rpl::router::RouteDecision
 * Purpose: Outcome of routing one command line.
 * Inputs: Populated by Route().
 * Outputs: kind, plus the lowercased lint name when kind == Explain.
 */
struct RouteDecision {
  RouteKind kind = RouteKind::Proceed;
  std::string lint;
};

/*** IsHelpFlag: -h or --help. */
bool IsHelpFlag(const std::string& arg);

/*** IsVersionFlag: -V or --version. */
bool IsVersionFlag(const std::string& arg);

/***
 * Name: cargo_rpl::router::Route
 * Purpose: Decide whether the run ends early and why.
 * Inputs:
 *   - args: every token of the command line
 * Outputs: RouteDecision (Proceed when no global flag is present)
 * Theory of Operation: A trailing --explain with no lint degrades to Help.
 */
RouteDecision Route(const std::vector<std::string>& args);

}  // namespace router
}  // namespace cargo_rpl
