/***
 * Name: cargo_rpl::router::IsVersionFlag
 * Purpose: Recognize -V/--version.
 * Inputs: arg
 * Outputs: true on match
 */
#include "cargo_rpl/router/router.h"

#include <string>

namespace cargo_rpl::router {

auto IsVersionFlag(const std::string& arg) -> bool { return arg == "-V" || arg == "--version"; }

}  // namespace cargo_rpl::router
