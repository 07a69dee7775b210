/// \file RegionGrid.h
/// \brief Axial-radial arrangement of material regions.

#ifndef REGION_GRID_H_
#define REGION_GRID_H_

#include <vector>

#include "soltran/constants.h"
#include "soltran/MaterialRegion.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class RegionGrid
/// \brief A cylinder of solution split into rows and columns
/// \details Regions are stored row-major, bottom row first and inner
///          column first. Region ids are 1..N in the same order.
///---------------------------------------------------------------------
class RegionGrid {

public:

  using iterator = std::vector<MaterialRegion>::iterator;
  using const_iterator = std::vector<MaterialRegion>::const_iterator;

  /// \brief Creates an empty grid.
  /// \param num_axial Number of rows.
  /// \param num_radial Number of columns.
  /// \param properties Thermophysical properties of the solution.
  /// \param ambient_temperature Temperature of fresh regions (K).
  /// \param pressure Pressure of the solution (Pa).
  RegionGrid(int num_axial, int num_radial, ThermoPropertiesPtr properties,
             double ambient_temperature = 300.,
             double pressure = STANDARD_PRESSURE);

  /// \brief Builds the regions at nominal geometry, discarding any
  ///        previous regions.
  /// \param nuclides Nuclide labels.
  /// \param number_densities Number densities in the order of nuclides.
  /// \param total_height Height of the solution (cm).
  /// \param total_radius Radius of the solution (cm).
  /// \param temperatures Temperatures carried over in id order. The
  ///        ambient temperature is used if it is empty.
  void build(const StringVec &nuclides,
             const std::vector<double> &number_densities,
             double total_height, double total_radius,
             const std::vector<double> &temperatures = std::vector<double>());

  /// \brief Establishes volumes and masses of all regions in id order.
  void applyVolumesMasses(const std::vector<double> &volumes,
                          const std::vector<double> &masses);

  /// \brief Cumulative heights of the rows, bottom to top.
  static std::vector<double> rowHeights(int num_axial, double total_height);

  /// \brief Outer radii of the columns, inner to outer.
  static std::vector<double> columnRadii(int num_radial, double total_radius);

  std::vector<double> temperatures() const;
  double maxTemperature() const;

  /// \brief Returns the top of the tallest region.
  double maxHeight() const;

  /// \brief Returns a region by id (1..N).
  MaterialRegion &region(int id);
  const MaterialRegion &region(int id) const;

  /// \brief Returns a region by row and column, both from 0.
  MaterialRegion &at(int row, int column);
  const MaterialRegion &at(int row, int column) const;

  /// \brief Returns the regions of a row, inner to outer.
  std::vector<MaterialRegion*> row(int i);

  iterator begin() { return _regions.begin(); }
  iterator end() { return _regions.end(); }
  const_iterator begin() const { return _regions.begin(); }
  const_iterator end() const { return _regions.end(); }

  size_t size() const { return _regions.size(); }
  bool empty() const { return _regions.empty(); }

  int getNumAxial() const { return _num_axial; }
  int getNumRadial() const { return _num_radial; }
  double getTotalHeight() const { return _total_height; }
  double getTotalRadius() const { return _total_radius; }
  void setTotalHeight(double height) { _total_height = height; }

private:

  int _num_axial;
  int _num_radial;

  ThermoPropertiesPtr _properties;
  double _ambient_temperature;
  double _pressure;

  double _total_height = 0.;
  double _total_radius = 0.;

  std::vector<MaterialRegion> _regions;

};

} // namespace soltran

#endif  // REGION_GRID_H_
