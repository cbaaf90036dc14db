/***
 * Name: cargo_rpl::driver::detail::NormalizeArgv
 * Purpose: Capture the process arguments once into the owned vector that the
 *   router, prefix stripping and invocation builder all read.
 * Inputs: argc, argv as handed to main()
 * Outputs: out, replaced with one string per argument (program name first)
 * Theory of Operation: A null entry becomes an empty token so positions seen by
 *   Route (e.g. the value after --explain) stay aligned with argv.
 */
#include "cargo_rpl/driver/cli.h"

#include <cstddef>
#include <string>
#include <vector>

namespace cargo_rpl {
namespace driver {
namespace detail {

void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out) {
  out.clear();
  if (argc <= 0 || argv == nullptr) {
    return;
  }
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    const char* arg_ptr = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    out.emplace_back(arg_ptr == nullptr ? "" : arg_ptr);
  }
}

}  // namespace detail
}  // namespace driver
}  // namespace cargo_rpl
