/// \file SolverResult.h
/// \brief Quantities reported by a transport solver run.

#ifndef SOLVER_RESULT_H_
#define SOLVER_RESULT_H_

#include <vector>

namespace soltran
{

/// \struct SolverResult
/// \brief Integral and per-region results of a criticality calculation
/// \details Per-region vectors are in region id order and exclude the
///          void region. The fission profile sums to 1.
struct SolverResult {

  double keff = 0.;           ///< Best estimate of k-eff
  double keff_sigma = 0.;     ///< One standard deviation of k-eff
  double keff_max = 0.;       ///< k-eff + 2 sigma, rounded to 5 decimals
  double lifetime = 0.;       ///< Neutron generation lifetime (s)
  double nubar = 0.;          ///< Neutrons per fission

  std::vector<double> volumes;          ///< cm^3
  std::vector<double> masses;           ///< g
  std::vector<double> fission_profile;  ///< Fraction of fissions per region

};

} // namespace soltran

#endif  // SOLVER_RESULT_H_
