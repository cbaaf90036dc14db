/***
 * Name: cargo_rpl::exec (analysis_args)
 * Purpose: Environment contract between cargo-rpl and rpl-driver.
 * Inputs: Ordered rpl-driver argument list / serialized RPL_ARGS text
 * Outputs: Serialized text / reconstructed argument list
 * Theory of Operation: Arguments travel through cargo in one environment
 *   variable, each one terminated by a private separator. An argument that
 *   itself contains the separator cannot be represented; this is a known
 *   limitation of the channel.
 */
#pragma once

#include <string>
#include <vector>

namespace cargo_rpl {
namespace exec {

inline constexpr const char* kWrapperEnvVar = "RUSTC_WORKSPACE_WRAPPER";
inline constexpr const char* kArgsEnvVar = "RPL_ARGS";
inline constexpr const char* kArgSeparator = "__RPL_HACKERY__";

/*** EncodeAnalysisArgs: Join args, appending kArgSeparator after each one. */
std::string EncodeAnalysisArgs(const std::vector<std::string>& args);

/*** DecodeAnalysisArgs: Inverse of EncodeAnalysisArgs; keeps a non-empty unterminated tail. */
std::vector<std::string> DecodeAnalysisArgs(const std::string& encoded);

}  // namespace exec
}  // namespace cargo_rpl
