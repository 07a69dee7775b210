#include "soltran/ResultsRecorder.h"
#include "soltran/errors.h"
#include "soltran/file_utils.h"
#include "soltran/log.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

namespace soltran
{


const std::string ResultsFile::header =
  "Time (s), Total Fissions, Max Temperature, Neutron Lifetime (s), k-eff, k-eff+2sigma";


ResultsFile::ResultsFile(std::string file, int time_decimals):
  _file(std::move(file)),
  _time_decimals(time_decimals)
{
  if (_file.empty())
    log::raise<ConfigurationError>("The results file path must not be empty");
  if (_time_decimals < 0)
    log::raise<ConfigurationError>("Number of decimals must be non-negative, got {}",
                                   _time_decimals);

  auto pos = _file.find_last_of('/');
  if (pos != std::string::npos)
    fileutils::createDirectory(_file.substr(0, pos + 1));
}


void ResultsFile::writeHeader(const RegionGrid &) {
  writeLine(header, true);
  log::verbose("Results will be written to '{}'", _file);
}


void ResultsFile::record(const TransientState &state, const RegionGrid &) {
  writeLine(formatRecord(state), false);
}


std::string ResultsFile::formatRecord(const TransientState &state) const {
  return fmt::format("{:.{}f}, {:E}, {}, {}, {}, {}",
                     state.time, _time_decimals, state.cumulative_fissions,
                     state.max_temperature, state.lifetime, state.keff,
                     state.keff_max);
}


void ResultsFile::writeLine(const std::string &line, bool truncate) {

  std::ofstream out(_file, truncate ? std::ios::trunc : std::ios::app);
  if (!out)
    log::raise<Error>("Failed to open results file '{}': {}", _file,
                      std::strerror(errno));

  out << line << "\n";
  out.close();

  if (out.fail())
    log::raise<Error>("Failed to write results file '{}'", _file);
}


} // namespace soltran
