/***
 * Name: cargo_rpl::support::Logger::Write
 * Purpose: Emit one prefixed diagnostic line.
 * Inputs:
 *   - level: severity label
 *   - msg: message text
 * Outputs: "cargo-rpl: <level>: <msg>\n" on the configured sink
 */
#include "cargo_rpl/support/log.h"

#include <iostream>
#include <string_view>

namespace cargo_rpl::support {

static const char* LevelName(Logger::Level level) {
  switch (level) {
    case Logger::Level::Error: return "error";
    case Logger::Level::Warn: return "warning";
    case Logger::Level::Debug: return "debug";
  }
  return "log";
}

auto Logger::Write(const Level level, const std::string_view msg) -> void {
  std::ostream& out = state_.sink != nullptr ? *state_.sink : std::cerr;
  out << "cargo-rpl: " << LevelName(level) << ": " << msg << '\n';
}

}  // namespace cargo_rpl::support
