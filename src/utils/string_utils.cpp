#include "soltran/string_utils.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace soltran {

namespace stringutils {

namespace {

bool notSpace(unsigned char c) { return !std::isspace(c); }

} // anonymous namespace


std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}


std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}


StringVec splitString(const std::string &input, const std::string &delimiter) {

  if (delimiter.empty())
    return splitString(input);

  StringVec words;
  std::string::size_type start = 0;

  while (start <= input.size()) {
    auto end = input.find(delimiter, start);
    if (end == std::string::npos)
      end = input.size();

    if (end > start)
      words.push_back(input.substr(start, end - start));

    start = end + delimiter.size();
  }

  return words;
}


StringVec splitString(const std::string &input) {
  StringVec words;
  std::istringstream ss(input);
  std::string w;

  while (ss >> w)
    words.push_back(w);

  return words;
}


std::string ltrim(std::string s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
  return s;
}


std::string rtrim(std::string s) {
  s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
  return s;
}


std::string trim(std::string s) {
  return ltrim(rtrim(std::move(s)));
}


bool isSpaces(const std::string &s) {
  return std::none_of(s.begin(), s.end(), notSpace);
}


bool startsWith(const std::string &s, const std::string &prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}


bool endsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}


std::string underscoreToSpace(std::string s) {
  s = trim(std::move(s));
  std::replace(s.begin(), s.end(), '_', ' ');
  return s;
}


std::string removeDigits(std::string s) {
  s.erase(std::remove_if(s.begin(), s.end(),
                         [](unsigned char c) { return std::isdigit(c); }),
          s.end());
  return s;
}


StringVec toWordVec(const std::string &s, const std::string &delimiter) {
  StringVec words;

  for (const auto &w : splitString(s, delimiter)) {
    auto t = trim(w);
    if (!t.empty())
      words.push_back(t);
  }

  return words;
}


/// \details std::stod accepts a leading numeric prefix, so the whole
///          word must be consumed for the conversion to succeed.
std::vector<double> toDoubleVec(const std::string &s,
                                const std::string &delimiter) {
  std::vector<double> values;

  for (const auto &w : toWordVec(s, delimiter)) {
    size_t pos = 0;
    double value = std::stod(w, &pos);
    if (pos != w.size())
      throw std::invalid_argument("Not a number: '" + w + "'");
    values.push_back(value);
  }

  return values;
}

} // namespace stringutils

} // namespace soltran
