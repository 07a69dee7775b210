#include "soltran/MaterialRegion.h"
#include "soltran/errors.h"
#include "soltran/log.h"

#include <cmath>
#include <utility>

namespace soltran
{

MaterialRegion::MaterialRegion(int id, StringVec nuclides,
                               std::vector<double> number_densities,
                               double temperature, double radius,
                               double height, double base_height,
                               ThermoPropertiesPtr properties,
                               double pressure)
  : _id(id),
    _nuclides(std::move(nuclides)),
    _number_densities(std::move(number_densities)),
    _temperature(temperature),
    _radius(radius),
    _height(height),
    _base_height(base_height),
    _pressure(pressure),
    _properties(std::move(properties)) {

  if (_id < 1)
    log::raise<InvariantViolation>("Region ids start from 1, got {}", _id);

  if (_nuclides.size() != _number_densities.size())
    log::raise<ConfigurationError>("Region {}: {} nuclides but {} number densities",
                                   _id, _nuclides.size(), _number_densities.size());

  if (!_properties)
    log::error("Region {}: no thermophysical properties", _id);

  if (!(_temperature > 0.))
    log::raise<InvariantViolation>("Region {}: temperature must be positive, got {} K",
                                   _id, _temperature);

  if (!(_radius > 0.))
    log::raise<InvariantViolation>("Region {}: radius must be positive, got {} cm",
                                   _id, _radius);

  if (!(getExtent() > 0.))
    log::raise<InvariantViolation>("Region {}: top {} cm is not above the bottom {} cm",
                                   _id, _height, _base_height);
}


/// \details The base area is the volume divided by the axial extent of
///          the region.
void MaterialRegion::setInitialVolumeMass(double volume, double mass) {

  if (_volume_established)
    log::raise<InvariantViolation>("Region {}: volume and mass are already established", _id);

  if (!(volume > 0.) || !std::isfinite(volume))
    log::raise<InvariantViolation>("Region {}: volume must be positive, got {} cm^3", _id, volume);

  if (!(mass > 0.) || !std::isfinite(mass))
    log::raise<InvariantViolation>("Region {}: mass must be positive, got {} g", _id, mass);

  _volume = volume;
  _mass = mass;

  _atoms.clear();
  for (auto n : _number_densities)
    _atoms.push_back(n * ATOMS_PER_BARN_CM * _volume);

  _base_area = _volume / getExtent();
  _volume_established = true;

  log::debug("Region {}: volume = {} cm^3, mass = {} g, base = {} cm^2",
             _id, _volume, _mass, _base_area);
}


void MaterialRegion::setHeight(double height) {

  if (!_volume_established)
    log::raise<InvariantViolation>("Region {}: height changed before the volume is known", _id);

  auto extent = height - _base_height;
  if (!(extent > 0.) || !std::isfinite(extent))
    log::raise<InvariantViolation>("Region {}: new top {} cm is not above the bottom {} cm",
                                   _id, height, _base_height);

  _height = height;
  _volume = _base_area * extent;

  for (size_t i = 0; i < _atoms.size(); ++i)
    _number_densities[i] = _atoms[i] / ATOMS_PER_BARN_CM / _volume;
}


void MaterialRegion::shiftAxially(double offset) {

  if (!std::isfinite(offset))
    log::raise<InvariantViolation>("Region {}: undefined axial shift", _id);

  _base_height += offset;
  _height += offset;
}


/// \details The specific heat is evaluated at the temperature before
///          heating.
void MaterialRegion::heatUp(double fissions) {

  if (!(fissions >= 0.) || !std::isfinite(fissions))
    log::raise<InvariantViolation>("Region {}: invalid number of fissions {}", _id, fissions);

  if (!(_mass > 0.))
    log::raise<InvariantViolation>("Region {}: cannot heat a region without mass", _id);

  auto cp = _properties->specificHeat(_temperature, _pressure);
  if (!(cp > 0.))
    log::raise<InvariantViolation>("Region {}: specific heat must be positive, got {} J/(kg K)",
                                   _id, cp);

  auto energy = fissions * ENERGY_PER_FISSION * JOULES_PER_MEV;
  auto temperature = _temperature + energy / (_mass / GRAMS_PER_KILOGRAM) / cp;

  _delta_temperature = temperature - _temperature;
  _temperature = temperature;
}


/// \details The height grows by dT * V * alpha / A, where alpha is the
///          volumetric expansion coefficient at the current temperature.
void MaterialRegion::expand() {

  if (!_volume_established)
    log::raise<InvariantViolation>("Region {}: cannot expand before the volume is known", _id);

  auto alpha = _properties->expansionCoefficient(_temperature, _pressure);
  auto delta_height = _delta_temperature * _volume * alpha / _base_area;

  setHeight(_height + delta_height);
}


RegionGeometry MaterialRegion::geometryRecord() const {
  return RegionGeometry{_id, _radius, _height, _base_height};
}


std::vector<NuclideRecord> MaterialRegion::compositionRecord() const {

  std::vector<NuclideRecord> records;
  for (size_t i = 0; i < _nuclides.size(); ++i)
    records.push_back(NuclideRecord{_nuclides[i], _id, _number_densities[i], _temperature});

  return records;
}

} // namespace soltran
