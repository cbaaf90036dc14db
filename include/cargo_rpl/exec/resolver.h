/***
 * Name: cargo_rpl::exec (resolver)
 * Purpose: Locate the rpl-driver executable handed to cargo as the compiler wrapper.
 * Inputs: The running executable's path (or a fixed path in tests)
 * Outputs: Absolute or relative path to rpl-driver
 * Theory of Operation: rpl-driver ships next to cargo-rpl. The lookup is
 *   platform specific, so callers depend on IExecutableResolver and main()
 *   supplies SiblingExecutableResolver.
 */
#pragma once

#include <string>
#include <utility>

namespace cargo_rpl {
namespace exec {

inline constexpr const char* kAnalysisToolName = "rpl-driver";

class IExecutableResolver {
 public:
  virtual ~IExecutableResolver() = default;

  /*** AnalysisToolPath: Path used for RUSTC_WORKSPACE_WRAPPER. */
  virtual std::string AnalysisToolPath() const = 0;
};

/*** SiblingPath: Replace the file name of `exe_path` with `name` (+".exe" on Windows). */
std::string SiblingPath(const std::string& exe_path, const std::string& name);

/*** CurrentExecutablePath: Path of the running binary; throws ResolveError. */
std::string CurrentExecutablePath();

class SiblingExecutableResolver : public IExecutableResolver {
 public:
  std::string AnalysisToolPath() const override;
};

class FixedPathResolver : public IExecutableResolver {
 public:
  explicit FixedPathResolver(std::string path) : path_(std::move(path)) {}
  std::string AnalysisToolPath() const override { return path_; }

 private:
  std::string path_;
};

}  // namespace exec
}  // namespace cargo_rpl
