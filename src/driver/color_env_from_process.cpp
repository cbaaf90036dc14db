/***
 * Name: cargo_rpl::driver::ColorEnv::FromProcess
 * Purpose: Snapshot the colour-related environment variables.
 * Inputs: CARGO_TERM_COLOR, NO_COLOR, CLICOLOR_FORCE
 * Outputs: ColorEnv
 */
#include "cargo_rpl/driver/cli.h"

#include "cargo_rpl/support/env.h"

namespace cargo_rpl::driver {

auto ColorEnv::FromProcess() -> ColorEnv {
  ColorEnv env;
  env.term_color = support::GetEnv("CARGO_TERM_COLOR");
  env.no_color = support::GetEnv("NO_COLOR");
  env.clicolor_force = support::GetEnv("CLICOLOR_FORCE");
  return env;
}

}  // namespace cargo_rpl::driver
