#include "soltran/ConfigInputCLI.h"
#include "soltran/log.h"

#include <cstdlib>
#include <iostream>

namespace soltran {

/// \brief Default constructor
ConfigInputCLI::ConfigInputCLI() {
  initializeOptions();
}


ConfigInputCLI::ConfigInputCLI(int &argc, char **argv):
  ConfigInput(argc, argv) {
  initializeOptions();
}


ConfigInputCLI::ConfigInputCLI(const StringVec &argv):
  ConfigInput(argv) {
  initializeOptions();
}

ConfigInputCLI::ConfigInputCLI(std::initializer_list<std::string> ilist):
  ConfigInput(ilist) {
  initializeOptions();
}


/// \details Negative numbers must be given in the form '--name=value'.
void ConfigInputCLI::initializeOptions() {

  // Get the underlying option parser
  auto &options = getParser();

  options.add_options()
    ("h,help",          "Display this help and exit.")
    (_l_loglevel,       "Set the minimum log level for output.\n"
                        "(default: info)\n"
                        "    error, warn, info, verbose, profile, debug"
                        , cxxopts::value<std::string>()->default_value(""))
    (_l_logline,        "Set the length of each log line."
                        , cxxopts::value<size_t>()->default_value(std::to_string(log::get_default_line_length())))
    (_a_logfile,        "Set the log path. (default: '')"
                        , cxxopts::value<std::string>()->default_value(""), "FILE")
  ;

  options.add_options("Case")
    (_a_conf,           "Set the path to the settings file (TOML or XML)."
                        , cxxopts::value<std::string>()->default_value(""), "FILE")
    (_a_case,           "Set the case name. It names the input decks of the "
                        "external solver. '.inp' is appended if missing."
                        , cxxopts::value<std::string>()->default_value(""), "NAME")
  ;

  options.add_options("Data output")
    (_a_outputdir,      "Set the output directory for decks, reports and results."
                        , cxxopts::value<std::string>()->default_value("."), "DIR")
    (_l_results,        "Set the name of the results file."
                        , cxxopts::value<std::string>()->default_value("results.txt"), "FILE")
    (_l_dump_regions,   "Dump the region history to regions.h5 in the output directory."
                        , cxxopts::value<bool>()->default_value("false"))
  ;

  options.add_options("Solution")
    (_l_nuclides,       "Specify the nuclide labels of the solution.\n"
                        "This is a comma-seperated list."
                        , cxxopts::value<std::string>()->default_value("h,n,o,u-234,u-235,u-236,u-238"), "LIST")
    (_l_ndens,          "Specify the number densities (atoms/barn-cm) of the nuclides.\n"
                        "This is a comma-seperated list in the order of nuclides."
                        , cxxopts::value<std::string>()->default_value(
                            "6.258e-2,1.569e-3,3.576e-2,1.060e-6,1.686e-4,4.350e-7,1.170e-5"), "LIST")
    (_l_density,        "Set the solution density (g/cm^3)."
                        , cxxopts::value<double>()->default_value("1.161"))
    (_l_mass_dens,      "Compute region masses from the solution density instead "
                        "of the solver report."
                        , cxxopts::value<bool>()->default_value("false"))
    (_l_temp,           "Set the initial solution temperature (K)."
                        , cxxopts::value<double>()->default_value("300"))
    (_l_pressure,       "Set the solution pressure (Pa)."
                        , cxxopts::value<double>()->default_value("101325"))
    (_l_props,          "Set the path to an HDF5 property table.\n"
                        "(default: water from CoolProp)"
                        , cxxopts::value<std::string>()->default_value(""), "FILE")
  ;

  options.add_options("Geometry")
    (_l_height,         "Set the initial solution height (cm)."
                        , cxxopts::value<double>()->default_value("53"))
    (_l_radius,         "Set the solution radius (cm)."
                        , cxxopts::value<double>()->default_value("15"))
    (_l_naxial,         "Set the number of axial regions."
                        , cxxopts::value<int>()->default_value("4"))
    (_l_nradial,        "Set the number of radial regions."
                        , cxxopts::value<int>()->default_value("3"))
    (_l_increment,      "Set the height added per time step during accumulation (cm)."
                        , cxxopts::value<double>()->default_value("1"))
  ;

  options.add_options("Kinetics")
    (_l_magnitude,      "Set the order of magnitude of the time step.\n"
                        "    e.g. --timestep-magnitude=-3 for 1 ms"
                        , cxxopts::value<int>()->default_value("-3"))
    (_l_source,         "Set the initial neutron population."
                        , cxxopts::value<double>()->default_value("1e10"))
    (_l_ceiling,        "Set the k-eff at which solution addition stops."
                        , cxxopts::value<double>()->default_value("1.01"))
    (_l_floor,          "Set the k-eff at which the transient terminates."
                        , cxxopts::value<double>()->default_value("1.0"))
    (_l_maxsteps,       "Set the maximum number of time steps (0 for unlimited)."
                        , cxxopts::value<int>()->default_value("0"))
  ;

  options.add_options("Solver")
    (_l_command,        "Set the command which runs the transport solver.\n"
                        "It is invoked as '<command> <deck>'."
                        , cxxopts::value<std::string>()->default_value("batch6.1"), "CMD")
    (_l_library,        "Set the cross-section library."
                        , cxxopts::value<std::string>()->default_value("v7-238"))
    (_l_gens,           "Set the number of generations per solver run."
                        , cxxopts::value<int>()->default_value("406"))
    (_l_timeout,        "Set the time limit of a solver run in seconds (0 for none)."
                        , cxxopts::value<double>()->default_value("0"))
    (_l_retries,        "Set the number of retries after a failed solver run."
                        , cxxopts::value<int>()->default_value("0"))
    (_l_backoff,        "Set the delay before the first retry in seconds.\n"
                        "The delay doubles for every further retry."
                        , cxxopts::value<double>()->default_value("1.0"))
  ;
}


void ConfigInputCLI::showHelp() {
  std::cout << getParser().help({"",
                                 "Case",
                                 "Data output",
                                 "Solution",
                                 "Geometry",
                                 "Kinetics",
                                 "Solver"})
            << std::endl;
  std::exit(0);
}


void ConfigInputCLI::showHelpAsNeeded() {

  // Print extra help which is provided by derived classes
  showExtraHelpAsNeeded();

  // Print help information if needed
  if (hasOption("help")) {
    showHelp();
  }
}

} // namespace soltran
