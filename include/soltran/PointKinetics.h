/// \file PointKinetics.h
/// \brief One-group point kinetics without delayed neutrons.

#ifndef POINT_KINETICS_H_
#define POINT_KINETICS_H_

#include <vector>

namespace soltran
{

///---------------------------------------------------------------------
/// \class PointKinetics
/// \brief Propagates the neutron population over a fixed time step
///---------------------------------------------------------------------
class PointKinetics {

public:

  /// \param timestep Time step in seconds.
  explicit PointKinetics(double timestep);

  double getTimestep() const { return _timestep; }

  /// \brief Returns the population after one time step.
  /// \details n(t + dt) = n(t) exp((k - 1) / l dt)
  /// \param keff Multiplication factor.
  /// \param lifetime Neutron generation lifetime (s).
  /// \param population Neutron population at the start of the step.
  double propagate(double keff, double lifetime, double population) const;

  /// \brief Splits the fissions caused by a population over regions.
  /// \param population Neutron population.
  /// \param nubar Average number of neutrons per fission.
  /// \param profile Fraction of fissions of each region.
  /// \return Number of fissions of each region.
  std::vector<double> distributeFissions(double population, double nubar,
                                         const std::vector<double> &profile) const;

private:

  double _timestep;

};

} // namespace soltran

#endif  // POINT_KINETICS_H_
