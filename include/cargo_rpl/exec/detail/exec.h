/***
 * Name: cargo_rpl::exec::detail (exec helpers)
 * Purpose: Internal helpers to build argv/envp arrays for execvp.
 * Inputs: Vector<string> storage; inherited environment block; overrides
 * Outputs: Null-terminated pointer arrays; merged NAME=value entries
 * Theory of Operation: Keep SpawnAndWait small; pointer arrays reference the
 *   string storage, which must outlive them.
 */
#pragma once

#include <string>
#include <vector>

#include "cargo_rpl/exec/command.h"

namespace cargo_rpl {
namespace exec {
namespace detail {

/*** BuildArgvMutable: Build null-terminated pointers referencing args storage. */
std::vector<char*> BuildArgvMutable(std::vector<std::string>& args);

/*** MergeEnvironment: Apply overrides to a NAME=value block; names stay unique. */
std::vector<std::string> MergeEnvironment(const char* const* base, const std::vector<EnvEntry>& overrides);

}  // namespace detail
}  // namespace exec
}  // namespace cargo_rpl
