#include "soltran/PointKinetics.h"
#include "soltran/errors.h"
#include "soltran/log.h"

#include <cmath>

namespace soltran
{

PointKinetics::PointKinetics(double timestep)
  : _timestep(timestep) {

  if (!(_timestep > 0.))
    log::raise<ConfigurationError>("Time step must be positive, got {} s", _timestep);
}


double PointKinetics::propagate(double keff, double lifetime, double population) const {

  if (!(lifetime > 0.))
    log::raise<InvariantViolation>("Neutron lifetime must be positive, got {} s", lifetime);

  if (!std::isfinite(keff))
    log::raise<InvariantViolation>("Undefined k-eff in propagation");

  auto next = population * std::exp((keff - 1.) / lifetime * _timestep);

  if (!std::isfinite(next))
    log::raise<InvariantViolation>("Neutron population overflowed: k-eff = {}, "
                                   "lifetime = {} s, population = {}",
                                   keff, lifetime, population);

  log::debug("Neutron population {:E} -> {:E}", population, next);

  return next;
}


std::vector<double> PointKinetics::distributeFissions(double population, double nubar,
                                                      const std::vector<double> &profile) const {

  if (!(nubar > 0.))
    log::raise<InvariantViolation>("nu-bar must be positive, got {}", nubar);

  std::vector<double> fissions;
  fissions.reserve(profile.size());

  for (auto fraction : profile)
    fissions.push_back(fraction * population / nubar);

  return fissions;
}

} // namespace soltran
