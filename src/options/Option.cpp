#include "soltran/Option.h"
#include "soltran/errors.h"
#include "soltran/log.h"

#include <vector>


namespace soltran {


Option::Option(int &argc, char **argv) {
  setArguments(argc, argv);
}


Option::Option(const StringVec &argv) {
  setArguments(argv);
}


Option::Option(std::initializer_list<std::string> ilist) {
  setArguments(StringVec(ilist));
}


cxxopts::Options& Option::getParser() {
  _parsed.reset();
  return _options;
}


/// \details cxxopts takes a C-style argument vector, which is built on
///          top of the strings in the argument list.
const cxxopts::ParseResult &Option::parsed() {

  if (!_parsed) {
    std::vector<const char*> argv;
    for (const auto &arg : _argv)
      argv.push_back(arg.c_str());

    try {
      _parsed.reset(new cxxopts::ParseResult(
        _options.parse(static_cast<int>(argv.size()), argv.data())));
    }
    catch (const std::exception &e) {
      log::raise<ConfigurationError>("Failed to parse arguments: {}", e.what());
    }
  }

  return *_parsed;
}


template <typename T>
T Option::value(const std::string &option) {
  const auto &result = parsed();
  try {
    return result[option].as<T>();
  }
  catch (const std::exception &e) {
    log::raise<ConfigurationError>("Invalid value of option '{}': {}", option, e.what());
  }
}


bool Option::hasOption(const std::string &option) {
  return parsed().count(option) > 0;
}


std::string Option::getOptionValue(const std::string &option) {
  return value<std::string>(option);
}


double Option::getOptionValueDouble(const std::string &option) {
  return value<double>(option);
}


int Option::getOptionValueInt(const std::string &option) {
  return value<int>(option);
}


size_t Option::getOptionValueSizet(const std::string &option) {
  return value<size_t>(option);
}


bool Option::getOptionValueBool(const std::string &option) {
  return value<bool>(option);
}


void Option::setArguments(int &argc, char **argv) {
  _argv.assign(argv, argv + argc);
  _parsed.reset();
  expandArguments();
}


void Option::setArguments(const StringVec &argv) {
  _argv.assign(1, "soltran");
  _argv.insert(_argv.end(), argv.begin(), argv.end());
  _parsed.reset();
  expandArguments();
}


void Option::setArguments(std::initializer_list<std::string> ilist) {
  setArguments(StringVec(ilist));
}


void Option::insertFrontArguments(const StringVec &argv) {
  _argv.insert(_argv.begin() + 1, argv.begin(), argv.end());
  _parsed.reset();
}


std::string Option::toString() const {
  StringVec quoted;
  for (const auto &arg : _argv)
    quoted.push_back("'" + arg + "'");
  return "Options: " + stringutils::join(quoted, " ");
}


} // namespace soltran
