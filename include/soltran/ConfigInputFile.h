/// \file ConfigInputFile.h
/// \brief Parsing settings file in format XML or TOML.

#ifndef CONFIGINPUTFILE_H_
#define CONFIGINPUTFILE_H_

#include <set>
#include <string>
#include <utility>  /* std::pair */
#include <vector>

#include "soltran/ConfigInputCLI.h"
#include "soltran/enum_types.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class ConfigInputFile
/// \brief A reader for settings in XML or TOML format
/// \details Options read from the file are inserted in front of the
///          command line arguments, so the latter take precedence.
///---------------------------------------------------------------------
class ConfigInputFile : public ConfigInputCLI
{
public:

  /// \brief Default constructor.
  ConfigInputFile() = default;

  /// \brief Construct an object with standard CLI arguments.
  /// \param argc The number of arguments (at least 1).
  /// \param argv The arguments, including the executable name.
  ConfigInputFile(int &argc, char **argv);

  /// \brief Construct an object with a vector of arguments.
  /// \param argv A vector of arguments, not including the executable name
  ConfigInputFile(const StringVec &argv);

  /// \brief Construct an object with a list of arguments.
  /// \param argv A list of arguments, not including the executable name
  ConfigInputFile(std::initializer_list<std::string> ilist);

  virtual ~ConfigInputFile() = default;

  /// \brief Expand argument -c.
  void expandArguments();

  /// \brief Print help messages for settings and exit.
  void showExtraHelpAsNeeded();

private:

  /// \brief A section of the settings file and its options
  struct Section {
    std::string name;                                          ///< "" for the root
    std::vector<std::pair<std::string, std::string>> options;  ///< file name, CLI name
  };

  /// \brief Initialize the cxxopts::Options object
  /// \details This method is supposed to be invoked after the base class
  ///          initializes its options.
  void initializeOptions();

  /// \brief Deduce the file format from the extension.
  /// \details '.xml' files are XML, everything else is TOML.
  settingsFormat deduceFileFormat();

  /// \brief Read arguments from a settings file
  void readArgumentsFromFile();

  ///< Options recognized in settings files
  const std::vector<Section> _sections {
    {"",         {{"log_level", _l_loglevel},
                  {"log_line",  _l_logline},
                  {"log_file",  _l_logfile}}},

    {"case",     {{"name", _l_case}}},

    {"output",   {{"directory",     _l_outputdir},
                  {"results",       _l_results},
                  {"dump_regions",  _l_dump_regions}}},

    {"solution", {{"nuclides",          _l_nuclides},
                  {"number_densities",  _l_ndens},
                  {"density",           _l_density},
                  {"mass_from_density", _l_mass_dens},
                  {"temperature",       _l_temp},
                  {"pressure",          _l_pressure},
                  {"properties",        _l_props}}},

    {"geometry", {{"height",            _l_height},
                  {"radius",            _l_radius},
                  {"axial_regions",     _l_naxial},
                  {"radial_regions",    _l_nradial},
                  {"height_increment",  _l_increment}}},

    {"kinetics", {{"timestep_magnitude",  _l_magnitude},
                  {"source",              _l_source},
                  {"keff_ceiling",        _l_ceiling},
                  {"keff_floor",          _l_floor},
                  {"max_steps",           _l_maxsteps}}},

    {"solver",   {{"command",     _l_command},
                  {"library",     _l_library},
                  {"generations", _l_gens},
                  {"timeout",     _l_timeout},
                  {"retries",     _l_retries},
                  {"backoff",     _l_backoff}}},
  };

  ///< Boolean options are passed as '--name=value'
  const std::set<std::string> _boolean_options = {
    "dump_regions",
    "mass_from_density",
  };
};


} // namespace soltran

#endif  // CONFIGINPUTFILE_H_
