/***
 * Name: cargo_rpl::router::IsHelpFlag
 * Purpose: Recognize -h/--help.
 * Inputs: arg
 * Outputs: true on match
 */
#include "cargo_rpl/router/router.h"

#include <string>

namespace cargo_rpl::router {

auto IsHelpFlag(const std::string& arg) -> bool { return arg == "-h" || arg == "--help"; }

}  // namespace cargo_rpl::router
