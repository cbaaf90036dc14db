/***
 * Name: cargo_rpl::exceptions::LaunchError
 * Purpose: Exception for failures to start the build orchestrator process.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Thrown type deriving from CargoRplException; the base
 *   constructor stays protected so only concrete errors are raised.
 */
#pragma once

#include <string>
#include <utility>

#include "cargo_rpl/exceptions/cargo_rpl_exception.h"

namespace cargo_rpl {
namespace exceptions {

class LaunchError : public CargoRplException {
 public:
  explicit LaunchError(std::string msg) noexcept : CargoRplException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace cargo_rpl
