/***
 * Name: cargo_rpl::exceptions::CargoRplException::what
 * Purpose: Expose the stored diagnostic to main() and to tests.
 * Inputs: none
 * Outputs: C-string valid while the exception object lives
 */
#include "cargo_rpl/exceptions/cargo_rpl_exception.h"

namespace cargo_rpl::exceptions {

const char* CargoRplException::what() const noexcept { return message_.c_str(); }

}  // namespace cargo_rpl::exceptions
