/***
 * Name: cargo_rpl::driver::VersionText / PrintVersion
 * Purpose: Produce the `cargo rpl --version` line.
 * Inputs: Build-time definitions CARGO_RPL_VERSION, CARGO_RPL_COMMIT_HASH, CARGO_RPL_COMMIT_DATE
 * Outputs: "rpl 0.1.0" or "rpl 0.1.0 (1a2b3c4d5 2024-05-01)"
 */
#include "cargo_rpl/driver/cli.h"

#include <ostream>
#include <string>
#include <string_view>

#ifndef CARGO_RPL_VERSION
#define CARGO_RPL_VERSION "0.1.0"
#endif
#ifndef CARGO_RPL_COMMIT_HASH
#define CARGO_RPL_COMMIT_HASH ""
#endif
#ifndef CARGO_RPL_COMMIT_DATE
#define CARGO_RPL_COMMIT_DATE ""
#endif

namespace cargo_rpl::driver {

auto VersionText() -> std::string {
  constexpr std::string_view kHash{CARGO_RPL_COMMIT_HASH};
  constexpr std::string_view kDate{CARGO_RPL_COMMIT_DATE};
  std::string text = "rpl " CARGO_RPL_VERSION;
  if (!kHash.empty() && !kDate.empty()) {
    text += " (";
    text += kHash;
    text += ' ';
    text += kDate;
    text += ')';
  }
  return text;
}

auto PrintVersion(std::ostream& out) -> void { out << VersionText() << '\n'; }

}  // namespace cargo_rpl::driver
