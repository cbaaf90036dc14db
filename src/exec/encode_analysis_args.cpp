/***
 * Name: cargo_rpl::exec::EncodeAnalysisArgs
 * Purpose: Serialize rpl-driver arguments into the RPL_ARGS value.
 * Inputs:
 *   - args: ordered argument list
 * Outputs: Concatenation of every argument followed by kArgSeparator
 * Theory of Operation: Each entry is terminated, not separated, so an empty
 *   argument still produces a separator and survives decoding.
 */
#include "cargo_rpl/exec/analysis_args.h"

#include <string>
#include <vector>

namespace cargo_rpl::exec {

auto EncodeAnalysisArgs(const std::vector<std::string>& args) -> std::string {
  std::string encoded;
  for (const auto& arg : args) {
    encoded += arg;
    encoded += kArgSeparator;
  }
  return encoded;
}

}  // namespace cargo_rpl::exec
