/***
 * Name: cargo_rpl::support::Logger
 * Purpose: Tool-prefixed diagnostics on stderr with an opt-in debug level.
 * Inputs: Message text; CARGO_RPL_LOG environment variable
 * Outputs: Lines of the form "cargo-rpl: <level>: <message>" on the sink
 * Theory of Operation: All state lives in a static registry shared by every
 *   caller. Debug output is off unless CARGO_RPL_LOG is truthy or "debug";
 *   the sink defaults to std::cerr and can be redirected by tests.
 */
#pragma once

#include <ostream>
#include <string_view>

namespace cargo_rpl {
namespace support {

class Logger {
 public:
  enum class Level { Error, Warn, Debug };

  struct State {
    bool debug{false};
    bool configured{false};
    std::ostream* sink{nullptr};
  };

  static void Error(std::string_view msg) { Write(Level::Error, msg); }
  static void Warn(std::string_view msg) { Write(Level::Warn, msg); }
  static void Debug(std::string_view msg) {
    if (DebugEnabled()) Write(Level::Debug, msg);
  }

  /*** DebugEnabled: Lazily read CARGO_RPL_LOG on first use. */
  static bool DebugEnabled();
  static void EnableDebug(bool on) {
    state_.debug = on;
    state_.configured = true;
  }
  /*** SetSink: Redirect output; nullptr restores std::cerr. */
  static void SetSink(std::ostream* sink) { state_.sink = sink; }
  static State& GetState() { return state_; }

  static void Write(Level level, std::string_view msg);

 private:
  static State state_;
};

}  // namespace support
}  // namespace cargo_rpl
