/// \file TransientSettings.h
/// \brief Physics and control parameters of a transient run.

#ifndef TRANSIENT_SETTINGS_H_
#define TRANSIENT_SETTINGS_H_

#include <cmath>
#include <cstdlib>
#include <vector>

#include "soltran/constants.h"
#include "soltran/string_utils.h"

namespace soltran
{

/// \struct TransientSettings
/// \brief Immutable parameters handed to the transient controller
/// \details The defaults describe a uranyl nitrate solution in a
///          53 cm x 15 cm cylinder split into 4 x 3 regions.
struct TransientSettings {

  //--------------------------------------
  // Solution
  //--------------------------------------
  StringVec nuclides = {"h", "n", "o", "u-234", "u-235", "u-236", "u-238"};

  ///< atoms/barn-cm, in the order of nuclides
  std::vector<double> number_densities = {6.258e-2, 1.569e-3, 3.576e-2,
                                          1.060e-6, 1.686e-4, 4.350e-7,
                                          1.170e-5};

  double ambient_temperature = 300.;      ///< K
  double pressure = STANDARD_PRESSURE;    ///< Pa

  //--------------------------------------
  // Geometry
  //--------------------------------------
  double height = 53.;                    ///< cm
  double radius = 15.;                    ///< cm
  int num_axial = 4;
  int num_radial = 3;
  double height_increment = 1.;           ///< cm per tick of accumulation

  //--------------------------------------
  // Kinetics
  //--------------------------------------
  int timestep_magnitude = -3;            ///< Time step is 10^magnitude s
  double source = 1.E10;                  ///< Initial neutron population
  double keff_ceiling = 1.01;             ///< Ends the accumulation phase
  double keff_floor = 1.0;                ///< Ends the expansion phase
  int max_steps = 0;                      ///< Tick limit, 0 for no limit

  /// \brief Returns the time step in seconds.
  double timestep() const { return std::pow(10., timestep_magnitude); }

  /// \brief Returns the number of decimals of recorded times.
  int timeDecimals() const { return std::abs(timestep_magnitude) + 1; }

};

} // namespace soltran

#endif  // TRANSIENT_SETTINGS_H_
