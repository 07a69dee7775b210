#include "soltran/PropertyTable.h"
#include "soltran/errors.h"
#include "soltran/HDF5Handler.h"
#include "soltran/log.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace soltran
{

PropertyTable::PropertyTable(std::vector<double> temperatures,
                             std::vector<double> specific_heats,
                             std::vector<double> expansions)
  : _temperatures(std::move(temperatures)),
    _specific_heats(std::move(specific_heats)),
    _expansions(std::move(expansions)) {

  if (_temperatures.size() < 2)
    log::raise<ConfigurationError>("A property table needs at least 2 temperatures, "
                                   "got {}", _temperatures.size());

  if (_specific_heats.size() != _temperatures.size() ||
      _expansions.size() != _temperatures.size())
    log::raise<ConfigurationError>("Property table columns differ in length: "
                                   "{} temperatures, {} specific heats, {} expansions",
                                   _temperatures.size(), _specific_heats.size(),
                                   _expansions.size());

  for (size_t i = 1; i < _temperatures.size(); ++i) {
    if (!(_temperatures[i] > _temperatures[i-1]))
      log::raise<ConfigurationError>("Property table temperatures must be strictly "
                                     "increasing at index {}", i);
  }

  for (auto cp : _specific_heats) {
    if (!(cp > 0.))
      log::raise<ConfigurationError>("Property table specific heats must be positive: {}", cp);
  }
}


std::shared_ptr<PropertyTable> PropertyTable::fromHDF5(const std::string &file) {

  log::info("Reading property table from '{}'", file);

  HDF5Handler h5(file, HDF5Mode::ReadOnly);
  auto root = h5.getFileId();

  auto table = std::make_shared<PropertyTable>(h5.readVector(root, "temperature"),
                                               h5.readVector(root, "specific_heat"),
                                               h5.readVector(root, "expansion"));

  log::verbose("Property table covers {} K to {} K with {} points",
               table->getMinTemperature(), table->getMaxTemperature(),
               table->getNumPoints());

  return table;
}


double PropertyTable::specificHeat(double temperature, double) const {
  return interpolate(_specific_heats, temperature);
}


double PropertyTable::expansionCoefficient(double temperature, double) const {
  return interpolate(_expansions, temperature);
}


double PropertyTable::interpolate(const std::vector<double> &column,
                                  double temperature) const {

  if (std::isnan(temperature))
    log::raise<InvariantViolation>("Property lookup at an undefined temperature");

  if (temperature < _temperatures.front() || temperature > _temperatures.back()) {
    if (!_clamp_warned) {
      log::warn("Temperature {} K is out of the property table [{}, {}] K, "
                "using the nearest bound", temperature,
                _temperatures.front(), _temperatures.back());
      _clamp_warned = true;
    }
    temperature = std::min(std::max(temperature, _temperatures.front()),
                           _temperatures.back());
  }

  // Index of the first point above the temperature
  auto it = std::upper_bound(_temperatures.begin(), _temperatures.end(), temperature);
  size_t i = std::min<size_t>(it - _temperatures.begin(), _temperatures.size() - 1);

  auto t0 = _temperatures[i-1];
  auto t1 = _temperatures[i];
  auto w = (temperature - t0) / (t1 - t0);

  return column[i-1] + w * (column[i] - column[i-1]);
}

} // namespace soltran
