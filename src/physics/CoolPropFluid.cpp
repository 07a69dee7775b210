#include "soltran/CoolPropFluid.h"
#include "soltran/constants.h"
#include "soltran/errors.h"
#include "soltran/log.h"
#include "soltran/string_utils.h"

#include <CoolProp.h>

#include <cmath>
#include <utility>

namespace soltran
{

CoolPropFluid::CoolPropFluid(std::string fluid)
  : _fluid(std::move(fluid)) {

  if (stringutils::isSpaces(_fluid))
    log::raise<ConfigurationError>("Fluid name of the property lookup is empty");

  // Fails early on unknown fluids
  evaluate("C", ZERO_CELSIUS + 20., STANDARD_PRESSURE);

  log::verbose("Thermophysical properties of '{}' are evaluated by CoolProp",
               _fluid);
}


double CoolPropFluid::specificHeat(double temperature, double pressure) const {
  return evaluate("C", temperature, pressure);
}


double CoolPropFluid::expansionCoefficient(double temperature, double pressure) const {
  return evaluate("ISOBARIC_EXPANSION_COEFFICIENT", temperature, pressure);
}


double CoolPropFluid::evaluate(const std::string &output, double temperature,
                               double pressure) const {

  if (!std::isfinite(temperature) || !(temperature > 0.))
    log::raise<InvariantViolation>("Property lookup at an undefined temperature {} K",
                                   temperature);
  if (!std::isfinite(pressure) || !(pressure > 0.))
    log::raise<InvariantViolation>("Property lookup at an undefined pressure {} Pa",
                                   pressure);

  double value = CoolProp::PropsSI(output, "T", temperature, "P", pressure, _fluid);

  if (!std::isfinite(value))
    log::raise<InvariantViolation>("CoolProp could not evaluate {} of '{}' at "
                                   "T = {} K, P = {} Pa: {}", output, _fluid,
                                   temperature, pressure,
                                   CoolProp::get_global_param_string("errstring"));

  return value;
}

} // namespace soltran
