/***
 * Name: cargo_rpl::driver::RunMain
 * Purpose: Top-level wrapper used by main(): run and report fatal errors.
 * Inputs:
 *   - args, resolver, out: forwarded to Run
 * Outputs:
 *   - int: Run's exit code, or kAbortExitCode after a logged error
 * Theory of Operation: LaunchError and ResolveError carry a complete message
 *   and are logged as is; any other std::exception is an internal error.
 */
#include "cargo_rpl/driver/app.h"

#include <exception>
#include <ostream>
#include <string>
#include <vector>

#include "cargo_rpl/exceptions/cargo_rpl_exception.h"
#include "cargo_rpl/support/log.h"

namespace cargo_rpl::driver {

auto RunMain(const std::vector<std::string>& args, const exec::IExecutableResolver& resolver, std::ostream& out)
    -> int {
  using support::Logger;
  try {
    return Run(args, resolver, out);
  }
  catch (const exceptions::CargoRplException& ex) {
    Logger::Error(ex.what());
  }
  catch (const std::exception& ex) {
    Logger::Error(std::string("internal error: ") + ex.what());
  }
  return kAbortExitCode;
}

}  // namespace cargo_rpl::driver
