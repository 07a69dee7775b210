/// \file CoolPropFluid.h
/// \brief Thermophysical properties evaluated by CoolProp.

#ifndef COOLPROP_FLUID_H_
#define COOLPROP_FLUID_H_

#include <string>

#include "soltran/ThermoProperties.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class CoolPropFluid
/// \brief Properties of a pure fluid from the CoolProp equations of state
/// \details Each lookup is a CoolProp::PropsSI call at the given
///          temperature and pressure. The fissile solution is
///          approximated by water unless another fluid is named.
///---------------------------------------------------------------------
class CoolPropFluid : public ThermoProperties {

public:

  /// \param fluid CoolProp fluid name
  explicit CoolPropFluid(std::string fluid = "Water");

  double specificHeat(double temperature, double pressure) const override;
  double expansionCoefficient(double temperature, double pressure) const override;

  const std::string &getFluid() const { return _fluid; }

private:

  /// \brief Evaluates an output of CoolProp at (T, P).
  double evaluate(const std::string &output, double temperature,
                  double pressure) const;

  std::string _fluid;

};

} // namespace soltran

#endif  // COOLPROP_FLUID_H_
