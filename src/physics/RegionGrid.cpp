#include "soltran/RegionGrid.h"
#include "soltran/errors.h"
#include "soltran/log.h"

#include <algorithm>
#include <utility>

namespace soltran
{

RegionGrid::RegionGrid(int num_axial, int num_radial,
                       ThermoPropertiesPtr properties,
                       double ambient_temperature, double pressure)
  : _num_axial(num_axial),
    _num_radial(num_radial),
    _properties(std::move(properties)),
    _ambient_temperature(ambient_temperature),
    _pressure(pressure) {

  if (_num_axial < 1 || _num_radial < 1)
    log::raise<ConfigurationError>("A grid needs at least one row and one column, "
                                   "got {} x {}", _num_axial, _num_radial);
}


void RegionGrid::build(const StringVec &nuclides,
                       const std::vector<double> &number_densities,
                       double total_height, double total_radius,
                       const std::vector<double> &temperatures) {

  if (nuclides.size() != number_densities.size())
    log::raise<ConfigurationError>("{} nuclides but {} number densities",
                                   nuclides.size(), number_densities.size());

  if (!(total_height > 0.) || !(total_radius > 0.))
    log::raise<InvariantViolation>("Grid dimensions must be positive: height {} cm, "
                                   "radius {} cm", total_height, total_radius);

  const size_t num_regions = _num_axial * _num_radial;

  if (!temperatures.empty() && temperatures.size() != num_regions)
    log::raise<InvariantViolation>("{} carried temperatures for {} regions",
                                   temperatures.size(), num_regions);

  auto heights = rowHeights(_num_axial, total_height);
  auto radii = columnRadii(_num_radial, total_radius);

  _regions.clear();
  _regions.reserve(num_regions);

  int id = 1;
  for (int i = 0; i < _num_axial; ++i) {
    double base_height = (i == 0) ? 0. : heights[i-1];

    for (int j = 0; j < _num_radial; ++j) {
      double temperature = temperatures.empty() ? _ambient_temperature
                                                : temperatures[id-1];
      _regions.emplace_back(id, nuclides, number_densities, temperature,
                            radii[j], heights[i], base_height,
                            _properties, _pressure);
      ++id;
    }
  }

  _total_height = total_height;
  _total_radius = total_radius;

  log::debug("Built a {} x {} grid, height = {} cm, radius = {} cm",
             _num_axial, _num_radial, total_height, total_radius);
}


void RegionGrid::applyVolumesMasses(const std::vector<double> &volumes,
                                    const std::vector<double> &masses) {

  if (volumes.size() != _regions.size() || masses.size() != _regions.size())
    log::raise<DataUnavailable>("Expected {} volumes and masses, got {} and {}",
                                _regions.size(), volumes.size(), masses.size());

  for (size_t i = 0; i < _regions.size(); ++i)
    _regions[i].setInitialVolumeMass(volumes[i], masses[i]);
}


std::vector<double> RegionGrid::rowHeights(int num_axial, double total_height) {

  std::vector<double> heights;
  for (int i = 1; i <= num_axial; ++i)
    heights.push_back(static_cast<double>(i) / num_axial * total_height);

  return heights;
}


std::vector<double> RegionGrid::columnRadii(int num_radial, double total_radius) {

  std::vector<double> radii;
  for (int j = 1; j <= num_radial; ++j)
    radii.push_back(static_cast<double>(j) / num_radial * total_radius);

  return radii;
}


std::vector<double> RegionGrid::temperatures() const {

  std::vector<double> temps;
  for (const auto &r : _regions)
    temps.push_back(r.getTemperature());

  return temps;
}


double RegionGrid::maxTemperature() const {

  if (_regions.empty())
    log::raise<InvariantViolation>("No temperature in an empty grid");

  auto it = std::max_element(_regions.begin(), _regions.end(),
                             [](const MaterialRegion &a, const MaterialRegion &b)
                             { return a.getTemperature() < b.getTemperature(); });
  return it->getTemperature();
}


double RegionGrid::maxHeight() const {

  if (_regions.empty())
    log::raise<InvariantViolation>("No height in an empty grid");

  auto it = std::max_element(_regions.begin(), _regions.end(),
                             [](const MaterialRegion &a, const MaterialRegion &b)
                             { return a.getHeight() < b.getHeight(); });
  return it->getHeight();
}


MaterialRegion &RegionGrid::region(int id) {
  return const_cast<MaterialRegion &>(
           static_cast<const RegionGrid &>(*this).region(id));
}


const MaterialRegion &RegionGrid::region(int id) const {

  if (id < 1 || id > static_cast<int>(_regions.size()))
    log::error("Region id {} is out of range [1, {}]", id, _regions.size());

  return _regions[id - 1];
}


MaterialRegion &RegionGrid::at(int row, int column) {
  return const_cast<MaterialRegion &>(
           static_cast<const RegionGrid &>(*this).at(row, column));
}


const MaterialRegion &RegionGrid::at(int row, int column) const {

  if (row < 0 || row >= _num_axial || column < 0 || column >= _num_radial)
    log::error("Region ({}, {}) is out of a {} x {} grid", row, column,
               _num_axial, _num_radial);

  return region(row * _num_radial + column + 1);
}


std::vector<MaterialRegion*> RegionGrid::row(int i) {

  std::vector<MaterialRegion*> regions;
  for (int j = 0; j < _num_radial; ++j)
    regions.push_back(&at(i, j));

  return regions;
}

} // namespace soltran
