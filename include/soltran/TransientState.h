/// \file TransientState.h
/// \brief Quantities tracked from tick to tick.

#ifndef TRANSIENT_STATE_H_
#define TRANSIENT_STATE_H_

#include <vector>

#include "soltran/enum_types.h"

namespace soltran
{

/// \struct TransientState
/// \brief Snapshot of a transient after a tick
struct TransientState {

  transientPhase phase = transientPhase::Initializing;

  int tick = 0;                      ///< 0 for the baseline
  double time = 0.;                  ///< s

  double population = 0.;            ///< Total neutron population
  double keff = 0.;
  double keff_max = 0.;              ///< k-eff + 2 sigma
  double lifetime = 0.;              ///< s
  double nubar = 0.;

  double cumulative_fissions = 0.;   ///< Including the baseline
  double tick_fissions = 0.;         ///< Fissions of the current tick

  double max_temperature = 0.;       ///< K
  double total_height = 0.;          ///< cm

  std::vector<double> fission_profile;   ///< Normalized, per region
  std::vector<double> region_fissions;   ///< Fissions of the current tick

};

} // namespace soltran

#endif  // TRANSIENT_STATE_H_
