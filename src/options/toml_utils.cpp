#include "soltran/toml_utils.h"
#include "soltran/errors.h"
#include "soltran/log.h"
#include "soltran/string_utils.h"

#include <iomanip>
#include <limits>
#include <sstream>

namespace soltran {

namespace tomlutils {

  std::string toString(const toml::value &v) {
    std::ostringstream ss;

    if (v.is_boolean())
      ss << std::boolalpha << toml::get<bool>(v);

    else if (v.is_integer())
      ss << toml::get<long>(v);

    else if (v.is_floating())
      ss << std::setprecision(std::numeric_limits<double>::max_digits10)
         << toml::get<double>(v);

    else if (v.is_string())
      ss << toml::get<std::string>(v);

    else if (v.is_array()) {
      StringVec words;
      for (const auto &e : v.as_array()) {
        if (e.is_array())
          log::raise<ConfigurationError>("Nested TOML arrays are not supported");
        words.push_back(toString(e));
      }
      ss << stringutils::join(words, ",");
    }

    else
      log::raise<ConfigurationError>("Failed to convert TOML type to C++ type");

    return ss.str();
  }

} // namespace tomlutils

} // namespace soltran
