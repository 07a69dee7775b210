#include "soltran/ConfigInput.h"
#include "soltran/errors.h"
#include "soltran/file_utils.h"

#include <cctype>
#include <stdexcept>

namespace soltran {

/// \brief Check user-defined arguments
/// \details Every getter checks its own value, so it is sufficient to
///          retrieve each argument once. Cross-argument constraints are
///          checked here.
void ConfigInput::validateArguments() {

  getLogLevel();
  getLogLineLength();
  getCaseName();

  // Composition
  auto nuclides = getNuclides();
  auto ndens = getNumberDensities();
  if (nuclides.size() != ndens.size())
    log::raise<ConfigurationError>("Number of nuclides ({}) does not match the number "
                                   "of number densities ({})", nuclides.size(), ndens.size());

  getSolutionDensity();
  getAmbientTemperature();
  getPressure();

  // Geometry
  getHeight();
  getRadius();
  getNumAxialRegions();
  getNumRadialRegions();
  getHeightIncrement();

  // Kinetics
  getTimestepMagnitude();
  getSource();
  getMaxSteps();
  if (getKeffCeiling() < getKeffFloor())
    log::raise<ConfigurationError>("The k-eff ceiling ({}) must not be lower than "
                                   "the k-eff floor ({})", getKeffCeiling(), getKeffFloor());

  // Solver
  getSolverCommand();
  getGenerations();
  getSolverTimeout();
  getSolverRetries();
  getSolverBackoff();
}


//----------------------------------------------------------------------
// Logging and reporting
//----------------------------------------------------------------------

/// \brief Initialize the logger
void ConfigInput::initializeLogger() {

  log::set_line_length(getLogLineLength());
  log::set_level(getLogLevel());

  auto path = getLogFile();

  // Create the log file only as needed
  if (!path.empty()) {
    log::set_path(path);
  }

}


/// \brief Returns the log level
log::level ConfigInput::getLogLevel() {

  log::level e = log::level::info;
  auto s = stringutils::trim(getOptionValue(_l_loglevel));

  // Keep the default if there is an empty string
  if (!stringutils::isSpaces(s)) {
    try {
      e = log::level::_from_string_nocase(s.c_str());
    } catch (const std::runtime_error &) {
      log::raise<ConfigurationError>("Invalid log level: {}", s);
    }
  }

  return e;

}


/// \brief Returns the log line length
/// \return The length of a log line (between 64 and 256)
size_t ConfigInput::getLogLineLength() {

  size_t length = getOptionValueSizet(_l_logline);

  if (length < 64 || length > 256) {
    log::raise<ConfigurationError>("Log line length must be a number within [64, 256]: {}",
                                   length);
  }

  return length;

}


/// \brief Returns the log file path
std::string ConfigInput::getLogFile() {

  auto path = stringutils::trim( getOptionValue(_l_logfile) );

  if (stringutils::isSpaces(path)) {
    path = "";
  }
  else {

    auto pos = path.find_last_of("/");

    if (pos == path.size() - 1) {
      // No file name specified, take the default
      path = path + "soltran.out";
    }
  }
  return path;
}


/// \brief Report input arguments
void ConfigInput::printArgumentsReport() {

  const int name_width = 24;

  log::verbose("Parsing arguments: {}", toString());

  log::info("Reporting runtime parameters...");
  log::info("{:-<{}}", "", name_width);
  log::info("{:<{}} = {}", "Log level",         name_width, stringutils::toUpper(enumToString(getLogLevel())));
  log::info("{:<{}} = {}", "Log line length",   name_width, getLogLineLength());
  log::info("{:<{}} = {}", "Log file",          name_width, getLogFile());

  log::info("{:-<{}}", "", name_width);
  log::info("{:<{}} = {}", "Config file",       name_width, getConfInputPath());
  log::info("{:<{}} = {}", "Case",              name_width, getCaseName());
  log::info("{:<{}} = {}", "Output directory",  name_width, getOutputDirectory());
  log::info("{:<{}} = {}", "Results file",      name_width, getResultsPath());
  if (doesDumpRegions())
    log::info("{:<{}} = {}", "Region history",  name_width, getRegionsDumpPath());

  log::info("{:-<{}}", "", name_width);
  log::info("{:<{}} = {}", "Nuclides",          name_width, stringutils::join(getNuclides(), ", "));
  log::info("{:<{}} = {}", "Number densities",  name_width, stringutils::join(getNumberDensities(), ", "));
  log::info("{:<{}} = {}", "Solution density",  name_width, getSolutionDensity());
  log::info("{:<{}} = {}", "Masses from density", name_width, doesComputeMassFromDensity());
  log::info("{:<{}} = {}", "Ambient temperature", name_width, getAmbientTemperature());
  log::info("{:<{}} = {}", "Pressure",          name_width, getPressure());
  log::info("{:<{}} = {}", "Property table",    name_width,
            getPropertiesPath().empty() ? "CoolProp water" : getPropertiesPath());

  log::info("{:-<{}}", "", name_width);
  log::info("{:<{}} = {}", "Height",            name_width, getHeight());
  log::info("{:<{}} = {}", "Radius",            name_width, getRadius());
  log::info("{:<{}} = {} x {}", "Regions",      name_width, getNumAxialRegions(), getNumRadialRegions());
  log::info("{:<{}} = {}", "Height increment",  name_width, getHeightIncrement());

  log::info("{:-<{}}", "", name_width);
  log::info("{:<{}} = 1e{}", "Time step",       name_width, getTimestepMagnitude());
  log::info("{:<{}} = {:.4E}", "Source",        name_width, getSource());
  log::info("{:<{}} = {}", "K-eff ceiling",     name_width, getKeffCeiling());
  log::info("{:<{}} = {}", "K-eff floor",       name_width, getKeffFloor());
  log::info("{:<{}} = {}", "Max steps",         name_width, getMaxSteps());

  log::info("{:-<{}}", "", name_width);
  log::info("{:<{}} = {}", "Solver command",    name_width, getSolverCommand());
  log::info("{:<{}} = {}", "XS library",        name_width, getXSLibrary());
  log::info("{:<{}} = {}", "Generations",       name_width, getGenerations());
  log::info("{:<{}} = {}", "Solver timeout",    name_width, getSolverTimeout());
  log::info("{:<{}} = {}", "Solver retries",    name_width, getSolverRetries());
  log::info("{:<{}} = {}", "Solver backoff",    name_width, getSolverBackoff());
  log::info("{:-<{}}", "", name_width);
}


//----------------------------------------------------------------------
// Case and output options
//----------------------------------------------------------------------

std::string ConfigInput::getConfInputPath() {
  return stringutils::trim( getOptionValue(_l_conf) );
}


/// \details The case name names the input deck of the external solver.
///          It must be a plain file name.
std::string ConfigInput::getCaseName() {

  auto name = stringutils::trim( getOptionValue(_l_case) );

  if (name.empty())
    log::raise<ConfigurationError>("A case name is required (--{})", _l_case);

  for (auto c : name) {
    if (c == '/' || c == '\\' || std::isspace(static_cast<unsigned char>(c)))
      log::raise<ConfigurationError>("Invalid case name '{}': path separators and "
                                     "whitespace are not allowed", name);
  }

  if (!stringutils::endsWith(name, ".inp"))
    name += ".inp";

  return name;
}


std::string ConfigInput::getOutputDirectory() {
  auto dir = stringutils::trim( getOptionValue(_l_outputdir) );
  return dir.empty() ? "." : dir;
}


std::string ConfigInput::getResultsPath() {

  auto file = stringutils::trim( getOptionValue(_l_results) );

  if (file.empty())
    log::raise<ConfigurationError>("Path to the results file is empty");

  return fileutils::joinPath(getOutputDirectory(), file);
}


bool ConfigInput::doesDumpRegions() {
  return getOptionValueBool(_l_dump_regions);
}


std::string ConfigInput::getRegionsDumpPath() {
  return fileutils::joinPath(getOutputDirectory(), "regions.h5");
}


//----------------------------------------------------------------------
// Solution options
//----------------------------------------------------------------------

StringVec ConfigInput::getNuclides() {

  auto words = stringutils::toWordVec(getOptionValue(_l_nuclides), ",");

  if (words.empty())
    log::raise<ConfigurationError>("At least one nuclide must be specified");

  return words;
}


std::vector<double> ConfigInput::getNumberDensities() {

  std::vector<double> ndens;

  try {
    ndens = stringutils::toDoubleVec(getOptionValue(_l_ndens), ",");
  } catch (const std::invalid_argument &e) {
    log::raise<ConfigurationError>("Invalid number densities: {}", e.what());
  }

  for (auto d : ndens) {
    if (d < 0.)
      log::raise<ConfigurationError>("Number densities must be non-negative: {}", d);
  }

  return ndens;
}


double ConfigInput::getSolutionDensity() {

  auto density = getOptionValueDouble(_l_density);

  if (density <= 0.)
    log::raise<ConfigurationError>("Solution density must be positive: {}", density);

  return density;
}


bool ConfigInput::doesComputeMassFromDensity() {
  return getOptionValueBool(_l_mass_dens);
}


double ConfigInput::getAmbientTemperature() {

  auto temperature = getOptionValueDouble(_l_temp);

  if (temperature <= 0.)
    log::raise<ConfigurationError>("Ambient temperature must be positive: {} K", temperature);

  return temperature;
}


double ConfigInput::getPressure() {

  auto pressure = getOptionValueDouble(_l_pressure);

  if (pressure <= 0.)
    log::raise<ConfigurationError>("Pressure must be positive: {} Pa", pressure);

  return pressure;
}


std::string ConfigInput::getPropertiesPath() {
  return stringutils::trim( getOptionValue(_l_props) );
}


//----------------------------------------------------------------------
// Geometry options
//----------------------------------------------------------------------

double ConfigInput::getHeight() {

  auto height = getOptionValueDouble(_l_height);

  if (height <= 0.)
    log::raise<ConfigurationError>("Solution height must be positive: {} cm", height);

  return height;
}


double ConfigInput::getRadius() {

  auto radius = getOptionValueDouble(_l_radius);

  if (radius <= 0.)
    log::raise<ConfigurationError>("Solution radius must be positive: {} cm", radius);

  return radius;
}


int ConfigInput::getNumAxialRegions() {

  auto n = getOptionValueInt(_l_naxial);

  if (n < 1)
    log::raise<ConfigurationError>("Number of axial regions must be at least 1: {}", n);

  return n;
}


int ConfigInput::getNumRadialRegions() {

  auto n = getOptionValueInt(_l_nradial);

  if (n < 1)
    log::raise<ConfigurationError>("Number of radial regions must be at least 1: {}", n);

  return n;
}


double ConfigInput::getHeightIncrement() {

  auto increment = getOptionValueDouble(_l_increment);

  if (increment <= 0.)
    log::raise<ConfigurationError>("Height increment must be positive: {} cm", increment);

  return increment;
}


//----------------------------------------------------------------------
// Kinetics options
//----------------------------------------------------------------------

/// \details The time step is 10^magnitude seconds.
int ConfigInput::getTimestepMagnitude() {

  auto magnitude = getOptionValueInt(_l_magnitude);

  if (magnitude >= 0)
    log::raise<ConfigurationError>("Time step magnitude must be negative: {}", magnitude);

  return magnitude;
}


double ConfigInput::getSource() {

  auto source = getOptionValueDouble(_l_source);

  if (source <= 0.)
    log::raise<ConfigurationError>("Initial neutron source must be positive: {}", source);

  return source;
}


double ConfigInput::getKeffCeiling() {
  return getOptionValueDouble(_l_ceiling);
}


double ConfigInput::getKeffFloor() {
  return getOptionValueDouble(_l_floor);
}


/// \details Zero means unlimited.
int ConfigInput::getMaxSteps() {

  auto steps = getOptionValueInt(_l_maxsteps);

  if (steps < 0)
    log::raise<ConfigurationError>("Max steps must be non-negative: {}", steps);

  return steps;
}


//----------------------------------------------------------------------
// Solver options
//----------------------------------------------------------------------

std::string ConfigInput::getSolverCommand() {

  auto command = stringutils::trim( getOptionValue(_l_command) );

  if (command.empty())
    log::raise<ConfigurationError>("Solver command is empty");

  return command;
}


std::string ConfigInput::getXSLibrary() {
  return stringutils::trim( getOptionValue(_l_library) );
}


int ConfigInput::getGenerations() {

  auto gens = getOptionValueInt(_l_gens);

  if (gens < 1)
    log::raise<ConfigurationError>("Number of generations must be at least 1: {}", gens);

  return gens;
}


/// \details Zero means the solver may run forever.
double ConfigInput::getSolverTimeout() {

  auto timeout = getOptionValueDouble(_l_timeout);

  if (timeout < 0.)
    log::raise<ConfigurationError>("Solver timeout must be non-negative: {} s", timeout);

  return timeout;
}


int ConfigInput::getSolverRetries() {

  auto retries = getOptionValueInt(_l_retries);

  if (retries < 0)
    log::raise<ConfigurationError>("Solver retries must be non-negative: {}", retries);

  return retries;
}


double ConfigInput::getSolverBackoff() {

  auto backoff = getOptionValueDouble(_l_backoff);

  if (backoff < 0.)
    log::raise<ConfigurationError>("Solver backoff must be non-negative: {} s", backoff);

  return backoff;
}


} // namespace soltran
