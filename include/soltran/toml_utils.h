/// \file toml_utils.h

#ifndef TOML_UTILS_H_
#define TOML_UTILS_H_

#include <string>

#include <toml.hpp>

namespace soltran {

///---------------------------------------------------------------------
/// \namespace tomlutils
/// \details Useful TOML interfaces for soltran.
///---------------------------------------------------------------------
namespace tomlutils {

  /// \brief Converts a toml::value to std::string.
  /// \details Arrays of scalars are converted to comma-separated lists,
  ///          which is the form expected by list options on the command
  ///          line.
  std::string toString(const toml::value &v);


} // namespace tomlutils

} // namespace soltran

#endif  // TOML_UTILS_H_
