/***
 * Name: cargo_rpl::driver::StdoutIsTerminal
 * Purpose: Report whether stdout is attached to a terminal.
 * Inputs: none
 * Outputs: isatty(STDOUT_FILENO) != 0
 */
#include "cargo_rpl/driver/cli.h"

#include <unistd.h>

namespace cargo_rpl::driver {

auto StdoutIsTerminal() -> bool { return isatty(STDOUT_FILENO) != 0; }

}  // namespace cargo_rpl::driver
