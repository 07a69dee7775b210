/// \file ProcessLauncher.h
/// \brief Running external programs as child processes (POSIX).

#ifndef PROCESS_LAUNCHER_H_
#define PROCESS_LAUNCHER_H_

#include <string>

#include "soltran/CancellationToken.h"
#include "soltran/string_utils.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class ProcessLauncher
/// \brief Starts a program and waits for it to finish
/// \details The program is looked up in PATH. The wait is bounded by an
///          optional timeout and can be cancelled through a token. The
///          child runs in its own process group, which is terminated as
///          a whole when the wait is abandoned.
///---------------------------------------------------------------------
class ProcessLauncher {

public:

  /// \param timeout Maximum wall time in seconds, 0 for no limit.
  /// \param token Cancellation token, may be null.
  /// \param poll_interval Interval between checks of the child (s).
  ProcessLauncher(double timeout = 0., CancellationTokenPtr token = nullptr,
                  double poll_interval = 0.05);

  double getTimeout() const { return _timeout; }

  /// \brief Runs a program to completion.
  /// \param args Program name followed by its arguments.
  /// \param working_directory Directory to run in, empty for the current one.
  /// \return The exit status of the program.
  /// \throw ProcessFailure The program could not be started, was killed
  ///        by a signal, timed out or was cancelled.
  int run(const StringVec &args, const std::string &working_directory = "") const;

private:

  /// \brief Terminates the process group of a child and reaps it.
  void terminate(int pid) const;

  double _timeout;
  CancellationTokenPtr _token;
  double _poll_interval;

};

} // namespace soltran

#endif  // PROCESS_LAUNCHER_H_
