/// \file Option.h
/// \brief An abstract class for option parsers

#ifndef OPTION_H_
#define OPTION_H_

#include <initializer_list>
#include <memory>
#include <string>

#include <cxxopts.hpp>

#include "soltran/string_utils.h"

namespace soltran {


///---------------------------------------------------------------------
/// \class Option
/// \brief Owns an argument list and the cxxopts parser for it
/// \details Derived classes define the options and may expand the
///          argument list, e.g. with arguments read from files. The
///          list is parsed lazily and parsed again after any change.
///          Validation and help messages are left to derived classes.
///---------------------------------------------------------------------
class Option {

protected:

  StringDeque _argv {"soltran"};             ///< Argument list
  cxxopts::Options _options {"soltran", ""}; ///< Underlying option parser

  /// \brief Returns the parser for defining options.
  cxxopts::Options& getParser();

  /// \brief Define options, to be implemented and called by derived classes.
  virtual void initializeOptions() = 0;

public:

  Option() = default;

  /// \param argc The number of arguments (at least 1).
  /// \param argv The arguments, including the executable name.
  Option(int &argc, char **argv);

  /// \param argv Arguments, not including the executable name
  Option(const StringVec &argv);
  Option(std::initializer_list<std::string> ilist);

  virtual ~Option() = default;

  /// \brief Check the existence of an option.
  bool hasOption(const std::string &);

  //--------------------------------------
  // Retrieve option values
  //--------------------------------------
  /// \brief Returns the value of a string option. Every string option
  ///        carries a default value, possibly empty.
  std::string getOptionValue(const std::string &);

  double getOptionValueDouble(const std::string &);
  int getOptionValueInt(const std::string &);
  size_t getOptionValueSizet(const std::string &);
  bool getOptionValueBool(const std::string &);

  //--------------------------------------
  // Manipulating arguments
  //--------------------------------------
  /// \brief Expands the argument list after it is set.
  virtual void expandArguments() { return; }

  /// \brief Replaces the arguments and calls expandArguments().
  void setArguments(int &argc, char **argv);
  void setArguments(const StringVec &argv);
  void setArguments(std::initializer_list<std::string> ilist);

  /// \brief Inserts arguments after the executable name.
  /// \details Inserted arguments precede the user's arguments, so the
  ///          latter take precedence for single-valued options.
  void insertFrontArguments(const StringVec &);

  /// \brief Lists the arguments, each quoted.
  std::string toString() const;

private:

  /// \brief Parses the argument list if it changed since the last call.
  const cxxopts::ParseResult &parsed();

  template <typename T>
  T value(const std::string &option);

  std::unique_ptr<cxxopts::ParseResult> _parsed;  ///< Cached parse result

};


} // namespace soltran

#endif  // OPTION_H_
