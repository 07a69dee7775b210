/// \file TransientController.h
/// \brief The state machine driving a transient.

#ifndef TRANSIENT_CONTROLLER_H_
#define TRANSIENT_CONTROLLER_H_

#include <vector>

#include "soltran/CancellationToken.h"
#include "soltran/GridUpdateStrategy.h"
#include "soltran/PointKinetics.h"
#include "soltran/RegionGrid.h"
#include "soltran/ResultsRecorder.h"
#include "soltran/SolverResult.h"
#include "soltran/ThermoProperties.h"
#include "soltran/TransientSettings.h"
#include "soltran/TransientState.h"
#include "soltran/TransportSolver.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class TransientController
/// \brief Advances a transient tick by tick
/// \details The run starts with a baseline solver query at nominal
///          geometry. Solution is then added while k-eff stays below the
///          ceiling, after which the solution heats up and expands until
///          k-eff drops to the floor.
///
///          Every tick heats the regions with fissions computed from the
///          solver result of the previous tick. The result obtained
///          during a tick drives the next one.
///
///          Any error escaping a tick, and any cancellation, leaves the
///          controller in the Aborted phase and nothing is recorded for
///          that tick.
///---------------------------------------------------------------------
class TransientController {

public:

  /// \param settings Parameters of the run.
  /// \param solver The transport solver to be queried once per tick.
  /// \param properties Thermophysical properties of the solution.
  /// \param recorders Sinks of the records.
  /// \param token Cancellation token, may be null.
  TransientController(TransientSettings settings,
                      TransportSolverPtr solver,
                      ThermoPropertiesPtr properties,
                      std::vector<ResultsRecorderPtr> recorders = {},
                      CancellationTokenPtr token = nullptr);

  /// \brief Runs the transient until it terminates.
  /// \return The state after the last tick.
  const TransientState &run();

  /// \brief Runs the baseline query and writes the t = 0 record.
  void initialize();

  /// \brief Advances the transient by one tick.
  /// \return False if the transient has already ended.
  bool step();

  transientPhase getPhase() const { return _state.phase; }
  bool isFinished() const;

  const TransientState &getState() const { return _state; }
  const RegionGrid &getGrid() const { return _grid; }
  const TransientSettings &getSettings() const { return _settings; }

private:

  /// \brief Enters a phase and selects its grid update strategy.
  void transition(transientPhase phase);

  /// \brief Enters the expansion phase if k-eff is above the floor,
  ///        otherwise terminates.
  void enterExpansionOrTerminate();

  /// \brief Sends the current state to every recorder.
  void record();

  void printProgress() const;

  /// \brief Raises an error if the run has been cancelled.
  void checkCancellation() const;

  /// \brief Raises an InvariantViolation unless k-eff, lifetime and nu-bar
  ///        of a solver result are finite and positive.
  void checkResult(const SolverResult &result) const;

  const TransientSettings _settings;

  TransportSolverPtr _solver;
  ThermoPropertiesPtr _properties;
  std::vector<ResultsRecorderPtr> _recorders;
  CancellationTokenPtr _token;

  PointKinetics _kinetics;
  RegionGrid _grid;
  GridUpdateStrategyPtr _strategy;

  TransientState _state;

  ///< Solver result of the previous tick
  SolverResult _previous;

  bool _initialized = false;

};

} // namespace soltran

#endif  // TRANSIENT_CONTROLLER_H_
