/// \file ExternalTransportSolver.h
/// \brief Criticality calculations by an external CSAS6 solver.

#ifndef EXTERNAL_TRANSPORT_SOLVER_H_
#define EXTERNAL_TRANSPORT_SOLVER_H_

#include <string>

#include "soltran/CancellationToken.h"
#include "soltran/DeckWriter.h"
#include "soltran/ProcessLauncher.h"
#include "soltran/Timer.h"
#include "soltran/TransportSolver.h"

namespace soltran
{

/// \struct ExternalSolverOptions
/// \brief Settings of an external solver
struct ExternalSolverOptions {
  std::string command = "batch6.1";   ///< Program, optionally with arguments
  std::string case_name = "case.inp"; ///< Deck name of the first invocation
  std::string output_directory = "."; ///< Where decks and reports live
  std::string library = "v7-238";     ///< Cross-section library
  int generations = 406;
  int timestep_magnitude = -3;        ///< Time step is 10^magnitude s
  double timeout = 0.;                ///< Seconds, 0 for no limit
  int retries = 0;                    ///< Extra attempts after a failure
  double backoff = 1.;                ///< Initial delay between attempts (s)
  bool mass_from_density = false;     ///< Masses are volume times density
  double solution_density = 1.161;    ///< g/cm^3
};


///---------------------------------------------------------------------
/// \class ExternalTransportSolver
/// \brief Runs an external solver on a deck per query and reads its report
/// \details Invocation n writes a deck named after the case and the time
///          n * 10^magnitude, runs '<command> <deck>' and parses the
///          report '<deck stem>.out'. The first invocation uses the case
///          name as it is and reuses an existing report of the same name.
///---------------------------------------------------------------------
class ExternalTransportSolver : public TransportSolver {

public:

  ExternalTransportSolver(ExternalSolverOptions options,
                          CancellationTokenPtr token = nullptr);

  SolverResult query(const RegionGrid &grid, bool recompute_volumes) override;

  /// \brief Returns the deck path of an invocation.
  std::string getDeckPath(int invocation) const;

  /// \brief Returns the report path of an invocation.
  std::string getReportPath(int invocation) const;

  int getNumInvocations() const { return _num_invocations; }

  const ExternalSolverOptions &getOptions() const { return _options; }

private:

  /// \brief Writes a deck, runs the solver and parses the report once.
  SolverResult attempt(const RegionGrid &grid, bool recompute_volumes,
                       int invocation);

  /// \brief Sleeps for a while unless the run is cancelled.
  bool pause(double seconds) const;

  ExternalSolverOptions _options;
  CancellationTokenPtr _token;
  DeckWriter _writer;
  ProcessLauncher _launcher;
  Timer _timer;

  int _num_invocations = 0;

};

} // namespace soltran

#endif  // EXTERNAL_TRANSPORT_SOLVER_H_
