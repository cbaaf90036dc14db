/***
 * Name: cargo_rpl::exceptions::ResolveError
 * Purpose: Exception for failures to locate the running executable or its siblings.
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

class ResolveError : public CargoRplException {
 public:
  explicit ResolveError(std::string msg) noexcept : CargoRplException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace cargo_rpl
