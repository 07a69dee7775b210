#include "soltran/ProcessLauncher.h"
#include "soltran/errors.h"
#include "soltran/log.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace soltran
{


ProcessLauncher::ProcessLauncher(double timeout, CancellationTokenPtr token,
                                 double poll_interval):
  _timeout(timeout),
  _token(std::move(token)),
  _poll_interval(poll_interval)
{
  if (_timeout < 0.)
    log::raise<ConfigurationError>("Solver timeout must be non-negative, got {}",
                                   _timeout);
  if (_poll_interval <= 0.)
    log::raise<ConfigurationError>("Polling interval must be positive, got {}",
                                   _poll_interval);
}


/// \details A close-on-exec pipe reports a failed exec back to the parent,
///          so that a missing program is told apart from a program which
///          exits with 127.
int ProcessLauncher::run(const StringVec &args,
                         const std::string &working_directory) const {

  if (args.empty() || args[0].empty())
    log::raise<ProcessFailure>("No program to run");

  auto command = stringutils::join(args, " ");

  if (_token && _token->isCancelled())
    log::raise<ProcessFailure>("Cancelled before starting '{}'", command);

  std::vector<char*> argv;
  for (const auto &a : args)
    argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  int fds[2];
  if (pipe(fds) != 0)
    log::raise<ProcessFailure>("Failed to create pipe for '{}': {}",
                               command, std::strerror(errno));
  fcntl(fds[1], F_SETFD, FD_CLOEXEC);

  log::verbose("Running '{}'", command);

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(fds[0]);
    close(fds[1]);
    log::raise<ProcessFailure>("Failed to fork for '{}': {}", command,
                               std::strerror(err));
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on
    close(fds[0]);
    setpgid(0, 0);
    if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
      int err = errno;
      ssize_t n = write(fds[1], &err, sizeof(err));
      (void)n;
      _exit(127);
    }
    execvp(argv[0], argv.data());
    int err = errno;
    ssize_t n = write(fds[1], &err, sizeof(err));
    (void)n;
    _exit(127);
  }

  setpgid(pid, pid);
  close(fds[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(fds[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close(fds[0]);

  if (n > 0) {
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) { }
    log::raise<ProcessFailure>("Failed to start '{}': {}", command,
                               std::strerror(exec_errno));
  }

  auto start = std::chrono::steady_clock::now();
  auto interval = std::chrono::duration<double>(_poll_interval);

  int status = 0;
  while (true) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid)
      break;

    if (r < 0 && errno != EINTR) {
      log::raise<ProcessFailure>("Failed to wait for '{}': {}", command,
                                 std::strerror(errno));
    }

    if (_token && _token->isCancelled()) {
      terminate(pid);
      log::raise<ProcessFailure>("Cancelled while running '{}'", command);
    }

    if (_timeout > 0.) {
      std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
      if (elapsed.count() > _timeout) {
        terminate(pid);
        log::raise<ProcessFailure>("'{}' timed out after {} s", command, _timeout);
      }
    }

    std::this_thread::sleep_for(interval);
  }

  if (WIFSIGNALED(status))
    log::raise<ProcessFailure>("'{}' was killed by signal {}", command,
                               WTERMSIG(status));

  int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  log::debug("'{}' exited with status {}", command, code);

  return code;
}


/// \details SIGTERM is sent first. SIGKILL follows if the child is still
///          alive after a grace period.
void ProcessLauncher::terminate(int pid) const {

  kill(-pid, SIGTERM);

  int status;
  for (int i = 0; i < 20; ++i) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid || (r < 0 && errno != EINTR))
      return;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) { }
}


} // namespace soltran
