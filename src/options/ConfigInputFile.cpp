#include "soltran/ConfigInputFile.h"
#include "soltran/errors.h"
#include "soltran/file_utils.h"
#include "soltran/log.h"
#include "soltran/SettingsTree.h"
#include "soltran/string_utils.h"

#include <algorithm>
#include <cstdlib>

namespace soltran
{

/// \details Arguments read from the settings file given by -c are
///          inserted in front of the command line ones. Without a
///          settings file this object behaves as a CLI object.
ConfigInputFile::ConfigInputFile(int &argc, char **argv)
  :ConfigInputCLI(argc, argv) {

  initializeOptions();
  expandArguments();
}


ConfigInputFile::ConfigInputFile(const StringVec &argv)
  :ConfigInputCLI(argv) {

  initializeOptions();
  expandArguments();
}


ConfigInputFile::ConfigInputFile(std::initializer_list<std::string> ilist)
  :ConfigInputCLI(ilist) {

  initializeOptions();
  expandArguments();
}


void ConfigInputFile::initializeOptions() {
  getParser().add_options()
    ("help-settings", "Display options for XML and TOML and exit.")
  ;
}


void ConfigInputFile::expandArguments() {

  const auto path = getConfInputPath();

  if (stringutils::isSpaces(path)) {
    log::verbose("No settings file, using command line arguments only");
    return;
  }

  if (!fileutils::existsFile(path))
    log::raise<ConfigurationError>("Cannot find settings file '{}'", path);

  readArgumentsFromFile();
}


settingsFormat ConfigInputFile::deduceFileFormat() {
  const auto ext = stringutils::toLower(fileutils::getExtension(getConfInputPath()));
  return ext == ".xml" ? settingsFormat::XML : settingsFormat::TOML;
}


/// \details Options missing from the file are skipped. Values starting
///          with a dash and boolean values are attached to the option
///          name with '=' so that cxxopts does not read them as options.
void ConfigInputFile::readArgumentsFromFile() {

  const auto file = getConfInputPath();
  auto tree = SettingsTree::create(deduceFileFormat());

  if (!tree->load(file)) {
    log::warn("Failed to find the root of settings file '{}', using default settings", file);
    return;
  }

  StringVec argv;

  for (const auto &section : _sections) {
    for (const auto &option : section.options) {
      std::string value;
      if (!tree->find(section.name, option.first, value))
        continue;

      const auto flag = "--" + option.second;
      if (_boolean_options.count(option.first) || stringutils::startsWith(value, "-")) {
        argv.push_back(flag + "=" + value);
      }
      else {
        argv.push_back(flag);
        argv.push_back(value);
      }
    }
  }

  log::verbose("Read {} arguments from settings file '{}'", argv.size(), file);

  ConfigInputCLI::insertFrontArguments(argv);
}


/// \details If 'help-settings' is found in the argument list, print
///          the settings layout and exit the program.
void ConfigInputFile::showExtraHelpAsNeeded() {

  if (!hasOption("help-settings"))
    return;

  size_t width = 0;
  for (const auto &section : _sections)
    for (const auto &option : section.options)
      width = std::max(width, option.first.size());
  width += 4;

  fmt::print("\nSections are sub-elements in XML and tables in TOML\n\n");
  fmt::print("{: <{}}{}\n", "File options", width, "CLI options");
  fmt::print("{:-<{}}{:-<{}}\n", "", width, "", 20);

  for (const auto &section : _sections) {
    fmt::print("\n{}\n", section.name.empty() ? "(root)" : "[" + section.name + "]");
    for (const auto &option : section.options)
      fmt::print("  {: <{}}--{}\n", option.first, width - 2, option.second);
  }

  std::exit(0);
}

} // namespace soltran
