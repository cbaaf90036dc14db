/***
 * Name: cargo_rpl::exec::DecodeAnalysisArgs
 * Purpose: Reconstruct the ordered argument list from an RPL_ARGS value.
 * Inputs:
 *   - encoded: text produced by EncodeAnalysisArgs
 * Outputs: Argument list
 * Theory of Operation: Every separator closes one entry. Text after the last
 *   separator is kept when non-empty so hand-written values without a trailing
 *   separator still decode.
 */
#include "cargo_rpl/exec/analysis_args.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace cargo_rpl::exec {

auto DecodeAnalysisArgs(const std::string& encoded) -> std::vector<std::string> {
  const std::string_view separator{kArgSeparator};
  std::vector<std::string> args;
  std::size_t start = 0;
  for (std::size_t pos = encoded.find(separator); pos != std::string::npos;
       pos = encoded.find(separator, start)) {
    args.emplace_back(encoded.substr(start, pos - start));
    start = pos + separator.size();
  }
  if (start < encoded.size()) {
    args.emplace_back(encoded.substr(start));
  }
  return args;
}

}  // namespace cargo_rpl::exec
