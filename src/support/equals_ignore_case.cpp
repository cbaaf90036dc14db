/***
 * Name: cargo_rpl::support::EqualsIgnoreCase
 * Purpose: Compare two strings ignoring ASCII case.
 * Inputs: lhs, rhs
 * Outputs: true when equal after case folding
 */
#include "cargo_rpl/support/env.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace cargo_rpl::support {

auto EqualsIgnoreCase(const std::string_view lhs, const std::string_view rhs) -> bool {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const auto lhs_ch = static_cast<unsigned char>(lhs[i]);
    const auto rhs_ch = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(lhs_ch) != std::tolower(rhs_ch)) {
      return false;
    }
  }
  return true;
}

}  // namespace cargo_rpl::support
