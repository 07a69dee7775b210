/// \file include/Factory.h
/// \brief Object factories

#ifndef FACTORY_H_
#define FACTORY_H_

#include <memory>
#include <string>
#include <vector>

#include "soltran/CancellationToken.h"
#include "soltran/CoolPropFluid.h"
#include "soltran/ConfigInputFile.h"
#include "soltran/ExternalTransportSolver.h"
#include "soltran/file_utils.h"
#include "soltran/PropertyTable.h"
#include "soltran/RegionDataHandlerHDF5.h"
#include "soltran/ResultsRecorder.h"
#include "soltran/TransientController.h"
#include "soltran/TransientSettings.h"

using std::shared_ptr;
using std::make_shared;
using std::static_pointer_cast;

namespace soltran
{

///---------------------------------------------------------------------
/// \class Factory
/// \brief A factory for objects
/// \details This class turns run-time settings into the objects of a
///          transient run.
///---------------------------------------------------------------------
class Factory {

public:

  // Alias for objects
  using ConfInputPtr  = shared_ptr<ConfigInput>;
  using ControllerPtr = shared_ptr<TransientController>;

  // Factory methods
  template <typename T>
  static ConfInputPtr getConfInput(int, char **);

  template <typename T>
  static ConfInputPtr getConfInput(const StringVec &);

  static TransientSettings getTransientSettings(ConfInputPtr);
  static ThermoPropertiesPtr getProperties(ConfInputPtr);
  static TransportSolverPtr getSolver(ConfInputPtr, CancellationTokenPtr = nullptr);
  static std::vector<ResultsRecorderPtr> getRecorders(ConfInputPtr);
  static ControllerPtr getController(ConfInputPtr, CancellationTokenPtr = nullptr);

};


/// \brief Create an object of ConfigInput
/// \details The child class is specified by template arguments.
/// \param argc number of CLI arguments
/// \param argv values of CLI arguments
/// \return a smart pointer to the object
template <typename T>
inline Factory::ConfInputPtr
Factory::getConfInput(int argc, char **argv) {

  return static_pointer_cast<ConfigInput>
          ( make_shared<T>(argc, argv) );

}


/// \brief Create an object of ConfigInput
/// \details The child class is specified by template arguments.
/// \param argv values of CLI arguments
/// \return a smart pointer to the object
template <typename T>
inline Factory::ConfInputPtr
Factory::getConfInput(const StringVec &argv) {

  return static_pointer_cast<ConfigInput>
          ( make_shared<T>(argv) );

}


/// \brief Collect the physics and control parameters of a run
/// \param conf runtime settings
inline TransientSettings
Factory::getTransientSettings(ConfInputPtr conf) {

  TransientSettings settings;

  settings.nuclides = conf->getNuclides();
  settings.number_densities = conf->getNumberDensities();
  settings.ambient_temperature = conf->getAmbientTemperature();
  settings.pressure = conf->getPressure();

  settings.height = conf->getHeight();
  settings.radius = conf->getRadius();
  settings.num_axial = conf->getNumAxialRegions();
  settings.num_radial = conf->getNumRadialRegions();
  settings.height_increment = conf->getHeightIncrement();

  settings.timestep_magnitude = conf->getTimestepMagnitude();
  settings.source = conf->getSource();
  settings.keff_ceiling = conf->getKeffCeiling();
  settings.keff_floor = conf->getKeffFloor();
  settings.max_steps = conf->getMaxSteps();

  return settings;

}


/// \brief Create the thermophysical properties of the solution
/// \details Water properties are evaluated by CoolProp unless a property
///          table is given.
/// \param conf runtime settings
inline ThermoPropertiesPtr
Factory::getProperties(ConfInputPtr conf) {

  auto path = conf->getPropertiesPath();

  if (path.empty())
    return make_shared<CoolPropFluid>("Water");

  log::info("Reading thermophysical properties from '{}'", path);
  return PropertyTable::fromHDF5(path);

}


/// \brief Create the external transport solver
/// \param conf runtime settings
/// \param token cancellation token of the run
inline TransportSolverPtr
Factory::getSolver(ConfInputPtr conf, CancellationTokenPtr token) {

  ExternalSolverOptions options;

  options.command = conf->getSolverCommand();
  options.case_name = conf->getCaseName();
  options.output_directory = conf->getOutputDirectory();
  options.library = conf->getXSLibrary();
  options.generations = conf->getGenerations();
  options.timestep_magnitude = conf->getTimestepMagnitude();
  options.timeout = conf->getSolverTimeout();
  options.retries = conf->getSolverRetries();
  options.backoff = conf->getSolverBackoff();
  options.mass_from_density = conf->doesComputeMassFromDensity();
  options.solution_density = conf->getSolutionDensity();

  return static_pointer_cast<TransportSolver>
          ( make_shared<ExternalTransportSolver>(options, token) );

}


/// \brief Create the sinks of records
/// \details The results file is always written. The region history is
///          written on request.
/// \param conf runtime settings
inline std::vector<ResultsRecorderPtr>
Factory::getRecorders(ConfInputPtr conf) {

  std::vector<ResultsRecorderPtr> recorders;

  auto decimals = std::abs(conf->getTimestepMagnitude()) + 1;
  recorders.push_back(make_shared<ResultsFile>(conf->getResultsPath(), decimals));

  if (conf->doesDumpRegions()) {
    fileutils::createDirectory(conf->getOutputDirectory());
    recorders.push_back(make_shared<RegionDataHandlerHDF5>(conf->getRegionsDumpPath()));
  }

  return recorders;

}


/// \brief Create a transient controller with all of its collaborators
/// \param conf runtime settings
/// \param token cancellation token of the run
inline Factory::ControllerPtr
Factory::getController(ConfInputPtr conf, CancellationTokenPtr token) {

  return make_shared<TransientController>(getTransientSettings(conf),
                                          getSolver(conf, token),
                                          getProperties(conf),
                                          getRecorders(conf),
                                          token);

}


} // namespace soltran

#endif  // FACTORY_H_
