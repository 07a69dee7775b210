/// \file MaterialRegion.h
/// \brief A discretized cell of the fissile solution.

#ifndef MATERIAL_REGION_H_
#define MATERIAL_REGION_H_

#include <string>
#include <vector>

#include "soltran/constants.h"
#include "soltran/string_utils.h"
#include "soltran/ThermoProperties.h"

namespace soltran
{

/// \struct RegionGeometry
/// \brief Geometric facts of a region written to solver decks.
struct RegionGeometry {
  int id;
  double radius;       ///< Outer radius (cm)
  double height;       ///< Axial coordinate of the top (cm)
  double base_height;  ///< Axial coordinate of the bottom (cm)
};


/// \struct NuclideRecord
/// \brief A nuclide entry of a region written to solver decks.
struct NuclideRecord {
  std::string label;
  int region_id;
  double number_density;  ///< atoms/barn-cm
  double temperature;     ///< K
};


///---------------------------------------------------------------------
/// \class MaterialRegion
/// \brief One axial-radial cell of the solution
/// \details A region is created with its nominal geometry. Its volume
///          and mass are unknown until they are measured by the
///          transport solver and established by setInitialVolumeMass().
///          From then on the atom inventory and the base area are fixed,
///          and height changes are reflected in the volume and the
///          number densities.
///---------------------------------------------------------------------
class MaterialRegion {

public:

  /// \brief Creates a region.
  /// \param id Sequential id (1..N, row-major).
  /// \param nuclides Nuclide labels.
  /// \param number_densities Number densities in the order of nuclides.
  /// \param temperature Temperature (K).
  /// \param radius Outer radius (cm).
  /// \param height Axial coordinate of the top (cm).
  /// \param base_height Axial coordinate of the bottom (cm).
  /// \param properties Thermophysical properties of the solution.
  /// \param pressure Pressure (Pa).
  MaterialRegion(int id, StringVec nuclides, std::vector<double> number_densities,
                 double temperature, double radius, double height, double base_height,
                 ThermoPropertiesPtr properties,
                 double pressure = STANDARD_PRESSURE);

  int getId() const { return _id; }
  const StringVec &getNuclides() const { return _nuclides; }
  const std::vector<double> &getNumberDensities() const { return _number_densities; }
  const std::vector<double> &getAtoms() const { return _atoms; }
  double getTemperature() const { return _temperature; }
  double getDeltaTemperature() const { return _delta_temperature; }
  double getRadius() const { return _radius; }
  double getHeight() const { return _height; }
  double getBaseHeight() const { return _base_height; }
  double getVolume() const { return _volume; }
  double getMass() const { return _mass; }
  double getBaseArea() const { return _base_area; }
  double getPressure() const { return _pressure; }

  /// \brief Returns the axial extent of the region (cm).
  double getExtent() const { return _height - _base_height; }

  /// \brief Returns true once the volume and mass have been established.
  bool hasVolume() const { return _volume_established; }

  /// \brief Establishes the volume and mass measured by the solver.
  /// \details The atom inventory and the base area are derived here,
  ///          with base_area = volume / (height - base_height).
  ///          This is allowed only once.
  void setInitialVolumeMass(double volume, double mass);

  /// \brief Moves the top of the region.
  /// \details The volume is base_area * (height - base_height), where
  ///          height is the new top and base_height the unchanged bottom.
  ///          The number densities are rescaled to conserve the atom
  ///          inventory.
  void setHeight(double height);

  /// \brief Translates the region along the axis without deforming it.
  void shiftAxially(double offset);

  /// \brief Deposits the energy of fissions into the region.
  /// \param fissions Number of fissions in the region during a time step.
  void heatUp(double fissions);

  /// \brief Expands the region according to the last temperature rise.
  void expand();

  RegionGeometry geometryRecord() const;
  std::vector<NuclideRecord> compositionRecord() const;

private:

  int _id;

  StringVec _nuclides;
  std::vector<double> _number_densities;

  ///< Atom inventory, derived once the volume is known
  std::vector<double> _atoms;

  double _temperature;
  double _delta_temperature = 0.;
  double _radius;
  double _height;
  double _base_height;
  double _volume = 0.;
  double _mass = 0.;
  double _base_area = 0.;
  double _pressure;

  bool _volume_established = false;

  ThermoPropertiesPtr _properties;

};

} // namespace soltran

#endif  // MATERIAL_REGION_H_
