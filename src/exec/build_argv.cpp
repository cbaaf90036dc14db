/***
 * Name: cargo_rpl::exec::detail::BuildArgvMutable
 * Purpose: View the orchestrator command line, or the merged NAME=value
 *   environment for the child, as the null-terminated char* array exec expects.
 * Inputs: args, which must outlive the returned array and not be resized
 * Outputs: vector<char*> ending in nullptr
 * Theory of Operation: SpawnAndWait builds both argv and envp before fork(), so
 *   the child only swaps environ and calls execvp without allocating.
 */
#include "cargo_rpl/exec/detail/exec.h"

#include <string>
#include <vector>

namespace cargo_rpl {
namespace exec {
namespace detail {

auto BuildArgvMutable(std::vector<std::string>& args) -> std::vector<char*> {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1U);
  for (auto& arg_str : args) {
    argv.push_back(arg_str.data());
  }
  argv.push_back(nullptr);
  return argv;
}

}  // namespace detail
}  // namespace exec
}  // namespace cargo_rpl
