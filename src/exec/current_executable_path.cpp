/***
 * Name: cargo_rpl::exec::CurrentExecutablePath
 * Purpose: Determine the path of the running cargo-rpl binary.
 * Inputs: none
 * Outputs: Absolute path of the current executable
 * Theory of Operation: /proc/self/exe on Linux, _NSGetExecutablePath on macOS.
 *   Other platforms, and any lookup failure, raise ResolveError.
 */
#include "cargo_rpl/exec/resolver.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#endif

#include "cargo_rpl/exceptions/resolve_error.h"

namespace cargo_rpl::exec {

auto CurrentExecutablePath() -> std::string {
#if defined(__linux__)
  std::error_code ec;
  const auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    throw exceptions::ResolveError("current executable path invalid: " + ec.message());
  }
  return path.string();
#elif defined(__APPLE__)
  std::uint32_t size = 0;
  (void)_NSGetExecutablePath(nullptr, &size);
  std::vector<char> buffer(size + 1U, '\0');
  if (_NSGetExecutablePath(buffer.data(), &size) != 0) {
    throw exceptions::ResolveError("current executable path invalid");
  }
  std::error_code ec;
  const auto canonical = std::filesystem::weakly_canonical(buffer.data(), ec);
  return ec ? std::string(buffer.data()) : canonical.string();
#else
  throw exceptions::ResolveError("current executable path is not available on this platform");
#endif
}

}  // namespace cargo_rpl::exec
