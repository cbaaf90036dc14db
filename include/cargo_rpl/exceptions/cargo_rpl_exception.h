/***
 * Name: cargo_rpl::exceptions::CargoRplException
 * Purpose: Base class for all cargo-rpl exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception so main() can report any failure,
 *   but every throw in cargo-rpl uses a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace cargo_rpl {
namespace exceptions {

class CargoRplException : public std::exception {
 public:
  virtual ~CargoRplException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit CargoRplException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace cargo_rpl
