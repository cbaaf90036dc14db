/***
 * Name: cargo_rpl::driver::ParseColorMode
 * Purpose: Interpret a CARGO_TERM_COLOR value.
 * Inputs: value
 * Outputs: Always, Never, or Auto for anything else
 */
#include "cargo_rpl/driver/cli.h"

#include <string_view>

#include "cargo_rpl/support/env.h"

namespace cargo_rpl::driver {

auto ParseColorMode(const std::string_view value) -> ColorMode {
  if (support::EqualsIgnoreCase(value, "always")) {
    return ColorMode::Always;
  }
  if (support::EqualsIgnoreCase(value, "never")) {
    return ColorMode::Never;
  }
  return ColorMode::Auto;
}

}  // namespace cargo_rpl::driver
