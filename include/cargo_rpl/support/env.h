/***
 * Name: cargo_rpl::support (env)
 * Purpose: Small helpers for reading process environment configuration.
 * Inputs: Variable names and raw values
 * Outputs: Optional values, truthiness checks, ASCII case helpers
 * Theory of Operation: Thin wrappers over std::getenv so callers never handle
 *   null pointers or compare case-sensitive spellings of boolean values.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cargo_rpl {
namespace support {

/*** GetEnv: Value of `name`, or std::nullopt when unset. */
std::optional<std::string> GetEnv(const char* name);

/*** EqualsIgnoreCase: ASCII case-insensitive comparison. */
bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);

/*** IsTrueValue: "1", "true" or "yes" (case-insensitive). */
bool IsTrueValue(std::string_view value);

/*** AsciiLower: Copy of `value` with ASCII letters folded to lowercase. */
std::string AsciiLower(std::string_view value);

}  // namespace support
}  // namespace cargo_rpl
