/***
 * Name: cargo_rpl::exceptions::CargoRplException::CargoRplException
 * Purpose: Store the diagnostic that main() prints as `cargo-rpl: error: <msg>`.
 * Inputs:
 *   - msg: complete sentence naming the failing program or path
 * Outputs: Initialized exception object
 * Theory of Operation: Reachable only through LaunchError and ResolveError.
 */
#include "cargo_rpl/exceptions/cargo_rpl_exception.h"

#include <string>
#include <utility>

namespace cargo_rpl {
namespace exceptions {

CargoRplException::CargoRplException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace cargo_rpl
