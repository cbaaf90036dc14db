/***
 * Name: cargo_rpl::support::AsciiLower
 * Purpose: Fold ASCII letters to lowercase, leaving other bytes untouched.
 * Inputs:
 *   - value: text to fold
 * Outputs: folded copy
 * Theory of Operation: Byte-wise; non-ASCII (UTF-8 continuation) bytes are preserved.
 */
#include "cargo_rpl/support/env.h"

#include <string>
#include <string_view>

namespace cargo_rpl::support {

auto AsciiLower(const std::string_view value) -> std::string {
  std::string out(value);
  for (auto& ch : out) {
    if (ch >= 'A' && ch <= 'Z') {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
  }
  return out;
}

}  // namespace cargo_rpl::support
