/***
 * Name: cargo_rpl::main
 * Purpose: Entry point for the cargo-rpl subcommand.
 * Inputs:
 *   - argc, argv: Standard process arguments (`cargo-rpl rpl [OPTIONS] [--] [ARGS...]`).
 * Outputs:
 *   - int: 0 on success, cargo's exit status on failure, 101 on a fatal error.
 * Theory of Operation:
 *   Captures argv once, then hands it to driver::RunMain together with the
 *   sibling-executable resolver; RunMain reports fatal errors with the tool prefix.
 */
#include <iostream>
#include <string>
#include <vector>

#include "cargo_rpl/driver/app.h"
#include "cargo_rpl/driver/cli.h"
#include "cargo_rpl/exec/resolver.h"

int main(int argc, char** argv) {
  std::vector<std::string> args;
  cargo_rpl::driver::detail::NormalizeArgv(argc, argv, args);
  const cargo_rpl::exec::SiblingExecutableResolver resolver;
  return cargo_rpl::driver::RunMain(args, resolver, std::cout);
}
