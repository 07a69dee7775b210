/// \file include/string_utils.h
/// \brief String utility

#ifndef STRING_UTILS_H_
#define STRING_UTILS_H_

#include <deque>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace soltran
{


// A vector of strings
using StringVec = std::vector<std::string>;

// A double-ended queue of strings
using StringDeque = std::deque<std::string>;


///---------------------------------------------------------------------
/// \namespace stringutils
/// \details Functions take their input by value and return the result.
///---------------------------------------------------------------------
namespace stringutils {

  std::string toUpper(std::string s);
  std::string toLower(std::string s);

  /// \brief Split a string by a delimiter. Empty words are dropped.
  StringVec splitString(const std::string &input, const std::string &delimiter);

  /// \brief Split a string by whitespace
  StringVec splitString(const std::string &input);

  /// \brief Join the elements of a container with a delimiter.
  template <typename Container>
  std::string join(const Container &c, const std::string &delimiter) {
    return fmt::format("{}", fmt::join(c, delimiter));
  }

  /// \brief Remove leading whitespace
  std::string ltrim(std::string s);

  /// \brief Remove trailing whitespace
  std::string rtrim(std::string s);

  std::string trim(std::string s);

  /// \brief Whether the string is empty or whitespace only
  bool isSpaces(const std::string &s);

  bool startsWith(const std::string &s, const std::string &prefix);
  bool endsWith(const std::string &s, const std::string &suffix);

  /// \brief Trim the string and replace underscores with spaces
  std::string underscoreToSpace(std::string s);

  /// \brief Remove every decimal digit
  std::string removeDigits(std::string s);

  /// \brief Converts a delimited list to trimmed words.
  /// \details Empty words are skipped.
  StringVec toWordVec(const std::string &s, const std::string &delimiter = ",");

  /// \brief Converts a delimited list of numbers to doubles.
  /// \details A word which is not a number as a whole makes the function
  ///          throw std::invalid_argument.
  std::vector<double> toDoubleVec(const std::string &s,
                                  const std::string &delimiter = ",");

} // namespace stringutils

} // namespace soltran

#endif  // STRING_UTILS_H_
