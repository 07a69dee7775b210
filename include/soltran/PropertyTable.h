/// \file PropertyTable.h
/// \brief Tabulated thermophysical properties.

#ifndef PROPERTY_TABLE_H_
#define PROPERTY_TABLE_H_

#include <memory>
#include <string>
#include <vector>

#include "soltran/ThermoProperties.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class PropertyTable
/// \brief Properties tabulated against temperature at a fixed pressure
/// \details Values between two temperatures are interpolated linearly.
///          Temperatures out of the table are clamped to its bounds, and
///          a warning is printed the first time this happens. The pressure
///          argument is ignored.
///---------------------------------------------------------------------
class PropertyTable : public ThermoProperties {

public:

  /// \brief Creates a table.
  /// \param temperatures Strictly increasing temperatures (K).
  /// \param specific_heats Specific heats (J/(kg K)), all positive.
  /// \param expansions Expansion coefficients (1/K).
  PropertyTable(std::vector<double> temperatures,
                std::vector<double> specific_heats,
                std::vector<double> expansions);

  /// \brief Reads a table from an HDF5 file.
  /// \details The file has three 1-D datasets '/temperature',
  ///          '/specific_heat' and '/expansion'.
  static std::shared_ptr<PropertyTable> fromHDF5(const std::string &file);

  double specificHeat(double temperature, double pressure) const override;
  double expansionCoefficient(double temperature, double pressure) const override;

  double getMinTemperature() const { return _temperatures.front(); }
  double getMaxTemperature() const { return _temperatures.back(); }
  size_t getNumPoints() const { return _temperatures.size(); }

private:

  /// \brief Interpolates a column of the table.
  double interpolate(const std::vector<double> &column, double temperature) const;

  std::vector<double> _temperatures;
  std::vector<double> _specific_heats;
  std::vector<double> _expansions;

  ///< Set once a temperature was clamped
  mutable bool _clamp_warned = false;

};

} // namespace soltran

#endif  // PROPERTY_TABLE_H_
