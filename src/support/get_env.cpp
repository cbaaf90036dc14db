/***
 * Name: cargo_rpl::support::GetEnv
 * Purpose: Read an environment variable without exposing null pointers.
 * Inputs:
 *   - name: variable name
 * Outputs:
 *   - optional<string>: value, or nullopt when the variable is unset
 * Theory of Operation: Wraps std::getenv; an empty value is still a value.
 */
#include "cargo_rpl/support/env.h"

#include <cstdlib>
#include <optional>
#include <string>

namespace cargo_rpl::support {

auto GetEnv(const char* name) -> std::optional<std::string> {
  const char* value = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace cargo_rpl::support
