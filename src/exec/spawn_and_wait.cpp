/***
 * Name: cargo_rpl::exec::SpawnAndWait
 * Purpose: Start the orchestrator with the wrapper environment and wait for it.
 * Inputs:
 *   - command: program, arguments, environment overrides
 * Outputs:
 *   - ExitStatus of the child
 * Theory of Operation:
 *   POSIX fork/exec/wait. A close-on-exec pipe stays open across a failed
 *   execvp, so the child writes errno into it before _exit; a successful exec
 *   closes it and the parent reads EOF. The child is always reaped.
 */
#include "cargo_rpl/exec/process.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "cargo_rpl/exceptions/launch_error.h"
#include "cargo_rpl/exec/detail/exec.h"

extern char** environ;  // NOLINT(readability-redundant-declaration)

namespace cargo_rpl::exec {

static void CloseQuietly(int& fd) {
  if (fd >= 0) {
    (void)close(fd);
    fd = -1;
  }
}

static std::string ErrnoText(int err) { return std::strerror(err); }

auto SpawnAndWait(const Command& command) -> ExitStatus {  // NOLINT(readability-function-size)
  std::vector<std::string> args;
  args.reserve(command.args.size() + 1U);
  args.push_back(command.program);
  args.insert(args.end(), command.args.begin(), command.args.end());
  auto argv = detail::BuildArgvMutable(args);
  auto env_entries = detail::MergeEnvironment(environ, command.env);
  auto envp = detail::BuildArgvMutable(env_entries);

  int error_pipe[2] = {-1, -1};
  if (pipe(error_pipe) != 0) {
    throw exceptions::LaunchError("could not run " + command.program + ": pipe() failed: " + ErrnoText(errno));
  }
  for (const int fd : error_pipe) {
    if (fcntl(fd, F_SETFD, FD_CLOEXEC) != 0) {
      const int fcntl_errno = errno;
      CloseQuietly(error_pipe[0]);
      CloseQuietly(error_pipe[1]);
      throw exceptions::LaunchError("could not run " + command.program + ": fcntl() failed: " + ErrnoText(fcntl_errno));
    }
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int fork_errno = errno;
    CloseQuietly(error_pipe[0]);
    CloseQuietly(error_pipe[1]);
    throw exceptions::LaunchError("could not run " + command.program + ": fork() failed: " + ErrnoText(fork_errno));
  }
  if (pid == 0) {
    (void)close(error_pipe[0]);
    environ = envp.data();
    execvp(argv[0], argv.data());
    const int exec_errno = errno;
    (void)!write(error_pipe[1], &exec_errno, sizeof(exec_errno));
    constexpr int kExecFailure = 127;
    _exit(kExecFailure);
  }

  CloseQuietly(error_pipe[1]);
  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = read(error_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (got < 0 && errno == EINTR);
  CloseQuietly(error_pipe[0]);

  int status = 0;
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);

  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    throw exceptions::LaunchError("could not run " + command.program + ": " + ErrnoText(exec_errno));
  }
  if (waited < 0) {
    throw exceptions::LaunchError("failed to wait for " + command.program + ": " + ErrnoText(errno));
  }

  ExitStatus result;
  if (WIFEXITED(status)) {
    result.exited = true;
    result.code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signal = WTERMSIG(status);
  }
  return result;
}

}  // namespace cargo_rpl::exec
