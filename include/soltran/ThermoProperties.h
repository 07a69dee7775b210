/// \file ThermoProperties.h
/// \brief Thermophysical properties of the solution.

#ifndef THERMO_PROPERTIES_H_
#define THERMO_PROPERTIES_H_

#include <memory>

namespace soltran
{

///---------------------------------------------------------------------
/// \class ThermoProperties
/// \brief Temperature and pressure dependent properties of a liquid
///---------------------------------------------------------------------
class ThermoProperties {

public:

  virtual ~ThermoProperties() = default;

  /// \brief Returns the isobaric specific heat.
  /// \param temperature Temperature in K.
  /// \param pressure Pressure in Pa.
  /// \return Specific heat in J/(kg K).
  virtual double specificHeat(double temperature, double pressure) const = 0;

  /// \brief Returns the isobaric volumetric expansion coefficient.
  /// \param temperature Temperature in K.
  /// \param pressure Pressure in Pa.
  /// \return Expansion coefficient in 1/K.
  virtual double expansionCoefficient(double temperature, double pressure) const = 0;

};

using ThermoPropertiesPtr = std::shared_ptr<const ThermoProperties>;

} // namespace soltran

#endif  // THERMO_PROPERTIES_H_
