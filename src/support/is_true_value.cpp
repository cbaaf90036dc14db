/***
 * Name: cargo_rpl::support::IsTrueValue
 * Purpose: Interpret an environment value as a boolean switch.
 * Inputs:
 *   - value: raw text
 * Outputs: true for "1", "true", "yes" (case-insensitive); false otherwise
 */
#include "cargo_rpl/support/env.h"

#include <string_view>

namespace cargo_rpl::support {

auto IsTrueValue(const std::string_view value) -> bool {
  if (value == "1") {
    return true;
  }
  return EqualsIgnoreCase(value, "true") || EqualsIgnoreCase(value, "yes");
}

}  // namespace cargo_rpl::support
