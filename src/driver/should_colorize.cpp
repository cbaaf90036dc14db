/***
 * Name: cargo_rpl::driver::ShouldColorize
 * Purpose: Resolve the colour decision for help output.
 * Inputs:
 *   - env: colour-related environment values
 *   - is_terminal: whether stdout is a tty
 * Outputs: true to emit ANSI sequences
 */
#include "cargo_rpl/driver/cli.h"

namespace cargo_rpl::driver {

auto ShouldColorize(const ColorEnv& env, const bool is_terminal) -> bool {
  if (env.term_color.has_value()) {
    const ColorMode mode = ParseColorMode(*env.term_color);
    if (mode == ColorMode::Always) {
      return true;
    }
    if (mode == ColorMode::Never) {
      return false;
    }
  }
  if (env.no_color.has_value() && !env.no_color->empty()) {
    return false;
  }
  if (env.clicolor_force.has_value() && !env.clicolor_force->empty() && *env.clicolor_force != "0") {
    return true;
  }
  return is_terminal;
}

}  // namespace cargo_rpl::driver
