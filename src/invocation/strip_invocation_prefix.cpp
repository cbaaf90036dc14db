/***
 * Name: cargo_rpl::invocation::StripInvocationPrefix
 * Purpose: Remove the program name and cargo's `rpl` subcommand token.
 * Inputs:
 *   - args: full command line
 * Outputs: Tokens for BuildInvocation
 */
#include "cargo_rpl/invocation/invocation.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cargo_rpl::invocation {

auto StripInvocationPrefix(const std::vector<std::string>& args) -> std::vector<std::string> {
  std::size_t skip = args.empty() ? 0U : 1U;
  if (args.size() > 1U && args[1] == kSubcommandToken) {
    skip = 2U;
  }
  return {args.begin() + static_cast<std::ptrdiff_t>(skip), args.end()};
}

}  // namespace cargo_rpl::invocation
