/***
 * Name: cargo_rpl::invocation::SubcommandName
 * Purpose: Render a Subcommand as the cargo subcommand token.
 * Inputs: subcommand
 * Outputs: "check" or "fix"
 */
#include "cargo_rpl/invocation/invocation.h"

namespace cargo_rpl::invocation {

auto SubcommandName(const Subcommand subcommand) -> const char* {
  switch (subcommand) {
    case Subcommand::Check: return "check";
    case Subcommand::Fix: return "fix";
  }
  return "check";
}

}  // namespace cargo_rpl::invocation
