/***
 * Name: cargo_rpl::exec (command)
 * Purpose: Turn an Invocation into a concrete cargo command line and environment.
 * Inputs: Invocation, executable resolver, orchestrator name
 * Outputs: Command (program, arguments, environment overrides)
 * Theory of Operation: Pure assembly with no process side effects, so the exact
 *   subprocess shape can be asserted in tests before anything is spawned.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cargo_rpl/exec/resolver.h"
#include "cargo_rpl/invocation/invocation.h"

namespace cargo_rpl {
namespace exec {

inline constexpr const char* kOrchestratorEnvVar = "CARGO";
inline constexpr const char* kDefaultOrchestrator = "cargo";

using EnvEntry = std::pair<std::string, std::string>;

/***
 * Name: cargo_rpl::exec::Command
 * Purpose: Fully resolved subprocess description.
 * Inputs: Populated by BuildCommand.
 * Outputs: Consumed by SpawnAndWait.
 * Theory of Operation: `env` holds overrides only; the child inherits the rest.
 */
struct Command {
  std::string program;
  std::vector<std::string> args;  // excludes argv[0]
  std::vector<EnvEntry> env;
};

/*** ResolveOrchestrator: $CARGO when set and non-empty, else "cargo". */
std::string ResolveOrchestrator(const std::optional<std::string>& env_value);

/*** BuildCommand: `<orchestrator> <subcommand> <orchestrator_args...>` with wrapper env. */
Command BuildCommand(const invocation::Invocation& inv,
                     const IExecutableResolver& resolver,
                     const std::string& orchestrator);

/*** RenderCommand: Shell-like one-line rendering for diagnostics. */
std::string RenderCommand(const Command& command);

}  // namespace exec
}  // namespace cargo_rpl
