/***
 * Name: cargo_rpl::invocation::BuildInvocation
 * Purpose: Partition argument tokens into cargo and rpl-driver argument lists.
 * Inputs:
 *   - args: tokens following `cargo-rpl rpl`
 * Outputs:
 *   - Invocation
 * Theory of Operation:
 *   --fix selects `cargo fix` and is not forwarded; --no-deps goes to the
 *   driver only; "--" ends the scan and the remaining tokens go to the driver
 *   uninterpreted; anything else is a cargo argument. A fix run always lints
 *   with --no-deps, added once when the user did not pass it anywhere.
 */
#include "cargo_rpl/invocation/invocation.h"

#include <algorithm>
#include <string>
#include <vector>

namespace cargo_rpl::invocation {

auto BuildInvocation(const std::vector<std::string>& args) -> Invocation {
  Invocation result;
  auto cursor = args.begin();
  for (; cursor != args.end(); ++cursor) {
    const std::string& arg = *cursor;
    if (arg == kFixFlag) {
      result.subcommand = Subcommand::Fix;
      continue;
    }
    if (arg == kNoDepsFlag) {
      result.analysis_args.push_back(arg);
      continue;
    }
    if (arg == kSeparator) {
      ++cursor;
      break;
    }
    result.orchestrator_args.push_back(arg);
  }
  result.analysis_args.insert(result.analysis_args.end(), cursor, args.end());

  if (result.subcommand == Subcommand::Fix &&
      std::find(result.analysis_args.begin(), result.analysis_args.end(), kNoDepsFlag) ==
          result.analysis_args.end()) {
    result.analysis_args.emplace_back(kNoDepsFlag);
  }
  return result;
}

}  // namespace cargo_rpl::invocation
