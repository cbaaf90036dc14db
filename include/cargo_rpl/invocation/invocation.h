/***
 * Name: cargo_rpl::invocation
 * Purpose: Partition the user's arguments into one cargo invocation.
 * Inputs: Argument tokens following `cargo-rpl rpl`
 * Outputs: Invocation (subcommand, cargo arguments, rpl-driver arguments)
 * Theory of Operation: Single left-to-right scan; --fix and --no-deps are
 *   intercepted, "--" hands the rest to the analysis tool, everything else goes
 *   to cargo. A post-pass synthesizes --no-deps for fix runs.
 */
#pragma once

#include <string>
#include <vector>

namespace cargo_rpl {
namespace invocation {

enum class Subcommand { Check, Fix };

/*** SubcommandName: "check" or "fix". */
const char* SubcommandName(Subcommand subcommand);

inline constexpr const char* kFixFlag = "--fix";
inline constexpr const char* kNoDepsFlag = "--no-deps";
inline constexpr const char* kSeparator = "--";
inline constexpr const char* kSubcommandToken = "rpl";

/***
 * Name: cargo_rpl::invocation::Invocation
 * Purpose: Everything needed to spawn cargo for one run.
 * Inputs: Populated by BuildInvocation.
 * Outputs: Consumed by exec::BuildCommand.
 */
struct Invocation {
  Subcommand subcommand = Subcommand::Check;
  std::vector<std::string> orchestrator_args;  // passed to cargo verbatim
  std::vector<std::string> analysis_args;      // passed to rpl-driver via RPL_ARGS
};

/***
 * Name: cargo_rpl::invocation::BuildInvocation
 * Purpose: Partition argument tokens into an Invocation.
 * Inputs:
 *   - args: tokens with the program name and `rpl` already stripped
 * Outputs: Populated Invocation; never fails (empty input yields a bare check)
 * Theory of Operation: Order-preserving scan followed by the --no-deps post-pass,
 *   which sees explicit flags from both sides of the separator.
 */
Invocation BuildInvocation(const std::vector<std::string>& args);

/***
 * Name: cargo_rpl::invocation::StripInvocationPrefix
 * Purpose: Drop the program name and the `rpl` token cargo inserts.
 * Inputs:
 *   - args: full command line
 * Outputs: Remaining tokens, in order
 * Theory of Operation: `cargo rpl --fix` runs `cargo-rpl rpl --fix`; a direct
 *   `cargo-rpl --fix` has no `rpl` token, so it is removed only when present
 *   right after the program name.
 */
std::vector<std::string> StripInvocationPrefix(const std::vector<std::string>& args);

}  // namespace invocation
}  // namespace cargo_rpl
