#include "soltran/ExternalTransportSolver.h"
#include "soltran/errors.h"
#include "soltran/file_utils.h"
#include "soltran/log.h"
#include "soltran/ReportParser.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <utility>

namespace soltran
{


/// Name of the timer split of solver wall time
static const std::string solver_split = "Transport solver";


ExternalTransportSolver::ExternalTransportSolver(ExternalSolverOptions options,
                                                 CancellationTokenPtr token):
  _options(std::move(options)),
  _token(token),
  _writer(_options.library, _options.generations),
  _launcher(_options.timeout, token)
{
  if (stringutils::isSpaces(_options.command))
    log::raise<ConfigurationError>("The solver command must not be empty");

  if (stringutils::isSpaces(_options.case_name))
    log::raise<ConfigurationError>("The case name must not be empty");

  if (!stringutils::endsWith(_options.case_name, ".inp"))
    _options.case_name += ".inp";

  if (_options.timestep_magnitude >= 0)
    log::raise<ConfigurationError>("Timestep magnitude must be negative, got {}",
                                   _options.timestep_magnitude);

  if (_options.retries < 0)
    log::raise<ConfigurationError>("Solver retries must be non-negative, got {}",
                                   _options.retries);

  if (_options.backoff < 0.)
    log::raise<ConfigurationError>("Solver backoff must be non-negative, got {}",
                                   _options.backoff);

  if (_options.mass_from_density && !(_options.solution_density > 0.))
    log::raise<ConfigurationError>("Solution density must be positive, got {}",
                                   _options.solution_density);

  if (_options.output_directory.empty())
    _options.output_directory = ".";
  fileutils::createDirectory(_options.output_directory);
}


/// \details Decks after the first one are named after the case with its
///          digits removed, followed by the digits of the simulated time,
///          e.g. 'case.inp' at 0.001 s with magnitude -3 gives
///          'case00010.inp'.
std::string ExternalTransportSolver::getDeckPath(int invocation) const {

  if (invocation == 0)
    return fileutils::joinPath(_options.output_directory, _options.case_name);

  auto stem = fileutils::replaceExtension(_options.case_name, "");
  stem = stringutils::removeDigits(stem);

  int decimals = std::abs(_options.timestep_magnitude) + 1;
  double time = invocation * std::pow(10., _options.timestep_magnitude);

  auto digits = fmt::format("{:.{}f}", time, decimals);
  digits.erase(std::remove(digits.begin(), digits.end(), '.'), digits.end());

  return fileutils::joinPath(_options.output_directory, stem + digits + ".inp");
}


std::string ExternalTransportSolver::getReportPath(int invocation) const {
  return fileutils::replaceExtension(getDeckPath(invocation), ".out");
}


/// \details Only process failures are retried, with delays growing as
///          backoff * 2^attempt. A cancelled run is never retried.
SolverResult ExternalTransportSolver::query(const RegionGrid &grid,
                                            bool recompute_volumes) {

  int invocation = _num_invocations++;

  _timer.startTimer();

  for (int i = 0; ; ++i) {
    try {
      auto result = attempt(grid, recompute_volumes, invocation);
      _timer.stopTimer(solver_split);
      return result;
    }
    catch (const ProcessFailure &e) {
      if (i >= _options.retries || (_token && _token->isCancelled())) {
        _timer.stopTimer(solver_split);
        throw;
      }

      double delay = _options.backoff * std::pow(2., i);
      log::warn("Solver attempt {} of {} failed: {}", i + 1,
                _options.retries + 1, e.what());
      log::warn("Retrying in {} s", delay);
      if (!pause(delay)) {
        _timer.stopTimer(solver_split);
        log::raise<ProcessFailure>("Cancelled while waiting to retry the solver");
      }
    }
    catch (const Error &) {
      _timer.stopTimer(solver_split);
      throw;
    }
  }
}


SolverResult ExternalTransportSolver::attempt(const RegionGrid &grid,
                                              bool recompute_volumes,
                                              int invocation) {

  auto deck = getDeckPath(invocation);
  auto report = getReportPath(invocation);

  if (invocation == 0 && fileutils::existsFile(report)) {
    log::info("Reusing existing report '{}'", report);
  }
  else {
    if (fileutils::existsFile(report) && std::remove(report.c_str()) != 0)
      log::raise<ProcessFailure>("Failed to remove stale report '{}'", report);

    _writer.writeDeckToFile(deck, grid, recompute_volumes);

    auto args = stringutils::splitString(_options.command);
    args.push_back(deck);

    int code = _launcher.run(args);

    if (!fileutils::existsFile(report))
      log::raise<ProcessFailure>("Solver exited with status {} without "
                                 "producing report '{}'", code, report);
    if (code != 0)
      log::warn("Solver exited with status {}, reading report '{}' anyway",
                code, report);
  }

  ReportParser parser(grid.size());
  bool require_masses = recompute_volumes && !_options.mass_from_density;
  auto result = parser.parseFile(report, require_masses);

  if (recompute_volumes && _options.mass_from_density) {
    result.masses.clear();
    for (auto v : result.volumes)
      result.masses.push_back(v * _options.solution_density);
  }

  log::verbose("Report '{}': k-eff = {}, lifetime = {}, nu-bar = {}",
               report, result.keff, result.lifetime, result.nubar);

  return result;
}


/// \return False if the run was cancelled in the meantime.
bool ExternalTransportSolver::pause(double seconds) const {

  auto until = std::chrono::steady_clock::now() +
               std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                 std::chrono::duration<double>(seconds));

  while (std::chrono::steady_clock::now() < until) {
    if (_token && _token->isCancelled())
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  return !(_token && _token->isCancelled());
}


} // namespace soltran
