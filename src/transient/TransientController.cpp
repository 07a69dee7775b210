#include "soltran/TransientController.h"
#include "soltran/errors.h"
#include "soltran/log.h"

#include <cmath>
#include <numeric>
#include <utility>

namespace soltran
{


TransientController::TransientController(TransientSettings settings,
                                         TransportSolverPtr solver,
                                         ThermoPropertiesPtr properties,
                                         std::vector<ResultsRecorderPtr> recorders,
                                         CancellationTokenPtr token):
  _settings(std::move(settings)),
  _solver(std::move(solver)),
  _properties(std::move(properties)),
  _recorders(std::move(recorders)),
  _token(std::move(token)),
  _kinetics(_settings.timestep()),
  _grid(_settings.num_axial, _settings.num_radial, _properties,
        _settings.ambient_temperature, _settings.pressure)
{
  if (!_solver)
    log::error("A transient cannot run without a transport solver");
  if (!_properties)
    log::error("A transient cannot run without thermophysical properties");

  if (_settings.timestep_magnitude >= 0)
    log::raise<ConfigurationError>("Timestep magnitude must be negative, got {}",
                                   _settings.timestep_magnitude);
  if (!(_settings.source > 0.))
    log::raise<ConfigurationError>("Source must be positive, got {}",
                                   _settings.source);
  if (_settings.keff_ceiling < _settings.keff_floor)
    log::raise<ConfigurationError>("k-eff ceiling {} is below the floor {}",
                                   _settings.keff_ceiling, _settings.keff_floor);
  if (_settings.max_steps < 0)
    log::raise<ConfigurationError>("Maximum number of steps must be non-negative, "
                                   "got {}", _settings.max_steps);

  for (const auto &r : _recorders) {
    if (!r)
      log::error("Null results recorder");
  }
}


bool TransientController::isFinished() const {
  return _state.phase == +transientPhase::Terminated ||
         _state.phase == +transientPhase::Aborted;
}


const TransientState &TransientController::run() {

  if (!_initialized)
    initialize();

  while (step()) { }

  log::info("Transient ended in phase {} at t = {:.{}f} s after {} ticks",
            enumToString(_state.phase), _state.time, _settings.timeDecimals(),
            _state.tick);

  return _state;
}


void TransientController::initialize() {

  if (_initialized)
    log::error("The transient has already been initialized");

  try {
    checkCancellation();

    log::info("Running the baseline calculation...");

    _grid.build(_settings.nuclides, _settings.number_densities,
                _settings.height, _settings.radius);

    auto result = _solver->query(_grid, true);
    _grid.applyVolumesMasses(result.volumes, result.masses);

    checkResult(result);

    _state.tick = 0;
    _state.time = 0.;
    _state.population = _settings.source;
    _state.keff = result.keff;
    _state.keff_max = result.keff_max;
    _state.lifetime = result.lifetime;
    _state.nubar = result.nubar;
    _state.cumulative_fissions = _state.population / result.nubar;
    _state.tick_fissions = 0.;
    _state.max_temperature = _grid.maxTemperature();
    _state.total_height = _grid.getTotalHeight();
    _state.fission_profile = result.fission_profile;
    _state.region_fissions.assign(_grid.size(), 0.);

    for (auto &r : _recorders)
      r->writeHeader(_grid);
    record();

    _previous = result;
    _initialized = true;
  }
  catch (const std::exception &) {
    _state.phase = transientPhase::Aborted;
    throw;
  }

  printProgress();

  if (_state.keff < _settings.keff_ceiling)
    transition(transientPhase::AccumulationPhase);
  else
    enterExpansionOrTerminate();
}


/// \details The population and the fissions of a tick are computed with
///          the previous result. The grid is then updated, queried and
///          heated with these fissions.
bool TransientController::step() {

  if (!_initialized)
    log::error("The transient must be initialized before stepping");

  if (isFinished())
    return false;

  if (_settings.max_steps > 0 && _state.tick >= _settings.max_steps) {
    log::warn("Reached the maximum number of steps ({}) in phase {}",
              _settings.max_steps, enumToString(_state.phase));
    transition(transientPhase::Terminated);
    return false;
  }

  try {
    checkCancellation();

    TransientState next = _state;
    next.tick = _state.tick + 1;
    next.time = next.tick * _settings.timestep();

    next.population = _kinetics.propagate(_previous.keff, _previous.lifetime,
                                          _state.population);
    next.region_fissions = _kinetics.distributeFissions(next.population,
                                                        _previous.nubar,
                                                        _previous.fission_profile);
    next.tick_fissions = std::accumulate(next.region_fissions.begin(),
                                         next.region_fissions.end(), 0.);

    auto result = _strategy->advance(_grid, *_solver);
    checkResult(result);

    if (next.region_fissions.size() != _grid.size())
      log::raise<InvariantViolation>("{} fission counts for {} regions",
                                     next.region_fissions.size(), _grid.size());

    int i = 0;
    for (auto &r : _grid)
      r.heatUp(next.region_fissions[i++]);

    next.keff = result.keff;
    next.keff_max = result.keff_max;
    next.lifetime = result.lifetime;
    next.nubar = result.nubar;
    next.cumulative_fissions = _state.cumulative_fissions + next.tick_fissions;
    next.max_temperature = _grid.maxTemperature();
    next.total_height = _grid.getTotalHeight();
    next.fission_profile = result.fission_profile;

    _state = std::move(next);
    _previous = std::move(result);
    record();
  }
  catch (const std::exception &) {
    _state.phase = transientPhase::Aborted;
    log::critical("Transient aborted at tick {}", _state.tick + 1);
    throw;
  }

  printProgress();

  if (_state.phase == +transientPhase::AccumulationPhase) {
    if (_state.keff >= _settings.keff_ceiling)
      enterExpansionOrTerminate();
  }
  else if (_state.phase == +transientPhase::ExpansionPhase) {
    if (_state.keff <= _settings.keff_floor)
      transition(transientPhase::Terminated);
  }

  return !isFinished();
}


void TransientController::transition(transientPhase phase) {

  switch (phase) {
    case transientPhase::AccumulationPhase:
      _strategy.reset(new MassAdditionStrategy(_settings));
      break;
    case transientPhase::ExpansionPhase:
      _strategy.reset(new ThermalExpansionStrategy());
      break;
    default:
      _strategy.reset();
      break;
  }

  log::info("Entering phase {} at t = {:.{}f} s (k-eff = {})",
            enumToString(phase), _state.time, _settings.timeDecimals(),
            _state.keff);

  _state.phase = phase;
}


void TransientController::enterExpansionOrTerminate() {
  if (_state.keff > _settings.keff_floor)
    transition(transientPhase::ExpansionPhase);
  else
    transition(transientPhase::Terminated);
}


void TransientController::record() {
  for (auto &r : _recorders)
    r->record(_state, _grid);
}


void TransientController::printProgress() const {

  log::info("Time = {:.{}f} s, k-eff = {}, k-eff+2sigma = {}, fissions = {:E}, "
            "max temperature = {:.2f} K", _state.time, _settings.timeDecimals(),
            _state.keff, _state.keff_max, _state.tick_fissions,
            _state.max_temperature);

  log::verbose("Population = {:E}, lifetime = {} s, nu-bar = {}, height = {} cm",
               _state.population, _state.lifetime, _state.nubar,
               _state.total_height);
}


void TransientController::checkCancellation() const {
  if (_token && _token->isCancelled())
    log::raise<ProcessFailure>("The transient was cancelled");
}


void TransientController::checkResult(const SolverResult &result) const {

  auto valid = [](double x) { return std::isfinite(x) && x > 0.; };

  if (!valid(result.keff))
    log::raise<InvariantViolation>("Solver returned an invalid k-eff {}",
                                   result.keff);
  if (!valid(result.lifetime))
    log::raise<InvariantViolation>("Solver returned an invalid neutron "
                                   "lifetime {} s", result.lifetime);
  if (!valid(result.nubar))
    log::raise<InvariantViolation>("Solver returned an invalid nu-bar {}",
                                   result.nubar);
}


} // namespace soltran
