/***
 * Name: cargo_rpl::support::Logger::state_
 * Purpose: Define the static logger state.
 * Inputs: N/A
 * Outputs: Process-wide logger configuration.
 * Theory of Operation: One definition for the class-declared static member.
 */
#include "cargo_rpl/support/log.h"

namespace cargo_rpl {
namespace support {

Logger::State Logger::state_{};

}  // namespace support
}  // namespace cargo_rpl
