/// \file ConfigInput.h
/// \brief Handling configuration input.

#ifndef CONFIGINPUT_H_
#define CONFIGINPUT_H_

#include <string>
#include <vector>

#include "soltran/log.h"
#include "soltran/Option.h"

namespace soltran {

///---------------------------------------------------------------------
/// \class ConfigInput
/// \brief A reader for run configuration
/// \details A configuration reader must provide several basic interfaces
///          such as:
///            get arguments (objects)
///            validate arguments
///            print help messages
///
///          Most of the arguments are checked when they are retrieved.
///          validateArguments() retrieves all of them once so that a bad
///          setting stops the program before the external solver is
///          ever launched.
///---------------------------------------------------------------------
class ConfigInput : public Option {

public:

  ConfigInput() = default;
  ConfigInput(int &argc, char **argv): Option(argc, argv) { }
  ConfigInput(const StringVec &argv): Option(argv) { }
  ConfigInput(std::initializer_list<std::string> ilist): Option(ilist) { }
  virtual ~ConfigInput() = default;

  //--------------------------------------
  // Interfaces
  //--------------------------------------
  virtual void showHelp() = 0;
  virtual void showHelpAsNeeded() = 0;
  virtual void showExtraHelpAsNeeded() = 0;
  virtual void validateArguments();

  //--------------------------------------
  // Logging and reporting
  //--------------------------------------
  void initializeLogger();
  virtual void printArgumentsReport();

  log::level getLogLevel();
  size_t getLogLineLength();
  std::string getLogFile();

  //--------------------------------------
  // Case and output options
  //--------------------------------------
  std::string getConfInputPath();

  /// \brief Returns the case name with the '.inp' extension.
  std::string getCaseName();

  std::string getOutputDirectory();

  /// \brief Returns the path to the results file under the output directory.
  std::string getResultsPath();

  bool doesDumpRegions();

  /// \brief Returns the path to the HDF5 region history.
  std::string getRegionsDumpPath();

  //--------------------------------------
  // Solution options
  //--------------------------------------
  StringVec getNuclides();
  std::vector<double> getNumberDensities();
  double getSolutionDensity();
  bool doesComputeMassFromDensity();
  double getAmbientTemperature();
  double getPressure();
  std::string getPropertiesPath();

  //--------------------------------------
  // Geometry options
  //--------------------------------------
  double getHeight();
  double getRadius();
  int getNumAxialRegions();
  int getNumRadialRegions();
  double getHeightIncrement();

  //--------------------------------------
  // Kinetics options
  //--------------------------------------
  int getTimestepMagnitude();
  double getSource();
  double getKeffCeiling();
  double getKeffFloor();
  int getMaxSteps();

  //--------------------------------------
  // Solver options
  //--------------------------------------
  std::string getSolverCommand();
  std::string getXSLibrary();
  int getGenerations();
  double getSolverTimeout();
  int getSolverRetries();
  double getSolverBackoff();


protected:

  const std::string _l_loglevel = "log-level";
  const std::string _l_logline  = "log-line";
  const std::string _l_logfile  = "log-file";
  const std::string _a_logfile  = "o,log-file";

  //-------------------------------------
  // Case and output options
  //-------------------------------------
  const std::string _l_conf       = "config";
  const std::string _a_conf       = "c,config";
  const std::string _l_case       = "case";
  const std::string _a_case       = "n,case";
  const std::string _l_outputdir  = "output-directory";
  const std::string _a_outputdir  = "d,output-directory";
  const std::string _l_results    = "results";
  const std::string _l_dump_regions = "dump-regions";

  //-------------------------------------
  // Solution options
  //-------------------------------------
  const std::string _l_nuclides   = "nuclides";
  const std::string _l_ndens      = "number-densities";
  const std::string _l_density    = "solution-density";
  const std::string _l_mass_dens  = "mass-from-density";
  const std::string _l_temp       = "ambient-temperature";
  const std::string _l_pressure   = "pressure";
  const std::string _l_props      = "properties";

  //-------------------------------------
  // Geometry options
  //-------------------------------------
  const std::string _l_height     = "height";
  const std::string _l_radius     = "radius";
  const std::string _l_naxial     = "axial-regions";
  const std::string _l_nradial    = "radial-regions";
  const std::string _l_increment  = "height-increment";

  //-------------------------------------
  // Kinetics options
  //-------------------------------------
  const std::string _l_magnitude  = "timestep-magnitude";
  const std::string _l_source     = "source";
  const std::string _l_ceiling    = "keff-ceiling";
  const std::string _l_floor      = "keff-floor";
  const std::string _l_maxsteps   = "max-steps";

  //-------------------------------------
  // Solver options
  //-------------------------------------
  const std::string _l_command    = "solver-command";
  const std::string _l_library    = "xs-library";
  const std::string _l_gens       = "generations";
  const std::string _l_timeout    = "solver-timeout";
  const std::string _l_retries    = "solver-retries";
  const std::string _l_backoff    = "solver-backoff";
};


} // namespace soltran

#endif  // CONFIGINPUT_H_
