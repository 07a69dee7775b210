/// \file TransportSolver.h
/// \brief The interface to criticality calculations.

#ifndef TRANSPORT_SOLVER_H_
#define TRANSPORT_SOLVER_H_

#include <memory>

#include "soltran/RegionGrid.h"
#include "soltran/SolverResult.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class TransportSolver
/// \brief Computes k-eff and the fission distribution of a grid
///---------------------------------------------------------------------
class TransportSolver {

public:

  virtual ~TransportSolver() = default;

  /// \brief Runs a criticality calculation of the grid.
  /// \details The call blocks until results are available.
  /// \param grid Regions at their current state.
  /// \param recompute_volumes Whether volumes and masses are required.
  /// \throw ProcessFailure The calculation could not be carried out.
  /// \throw DataUnavailable The results are incomplete.
  virtual SolverResult query(const RegionGrid &grid, bool recompute_volumes) = 0;

};

using TransportSolverPtr = std::shared_ptr<TransportSolver>;

} // namespace soltran

#endif  // TRANSPORT_SOLVER_H_
