/***
 * Name: cargo_rpl::exec::SiblingPath
 * Purpose: Derive the path of an executable installed next to another one.
 * Inputs:
 *   - exe_path: path of the reference executable
 *   - name: sibling executable name without extension
 * Outputs: Path with the file name replaced (".exe" appended on Windows)
 */
#include "cargo_rpl/exec/resolver.h"

#include <filesystem>
#include <string>

namespace cargo_rpl::exec {

auto SiblingPath(const std::string& exe_path, const std::string& name) -> std::string {
  std::filesystem::path sibling{exe_path};
  sibling.replace_filename(name);
#ifdef _WIN32
  sibling.replace_extension(".exe");
#endif
  return sibling.string();
}

}  // namespace cargo_rpl::exec
