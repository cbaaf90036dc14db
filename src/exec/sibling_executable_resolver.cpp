/***
 * Name: cargo_rpl::exec::SiblingExecutableResolver::AnalysisToolPath
 * Purpose: Locate rpl-driver next to the running cargo-rpl.
 * Inputs: none
 * Outputs: Path to rpl-driver
 * Theory of Operation: CurrentExecutablePath + SiblingPath; errors propagate.
 */
#include "cargo_rpl/exec/resolver.h"

#include <string>

#include "cargo_rpl/support/log.h"

namespace cargo_rpl::exec {

auto SiblingExecutableResolver::AnalysisToolPath() const -> std::string {
  const std::string tool = SiblingPath(CurrentExecutablePath(), kAnalysisToolName);
  support::Logger::Debug("analysis tool: " + tool);
  return tool;
}

}  // namespace cargo_rpl::exec
