/// \file GridUpdateStrategy.h
/// \brief Per-phase updates of the region grid.

#ifndef GRID_UPDATE_STRATEGY_H_
#define GRID_UPDATE_STRATEGY_H_

#include <memory>

#include "soltran/RegionGrid.h"
#include "soltran/SolverResult.h"
#include "soltran/TransientSettings.h"
#include "soltran/TransportSolver.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class GridUpdateStrategy
/// \brief Moves the grid to the geometry of a new tick and obtains the
///        solver result for it
///---------------------------------------------------------------------
class GridUpdateStrategy {

public:

  virtual ~GridUpdateStrategy() = default;

  /// \brief Updates the grid and queries the solver.
  /// \param grid The grid to be updated in place.
  /// \param solver The solver to be queried once.
  /// \return The result for the updated grid.
  virtual SolverResult advance(RegionGrid &grid, TransportSolver &solver) = 0;

  /// \brief Whether volumes and masses are measured by the solver.
  virtual bool recomputesVolumes() const = 0;

};

using GridUpdateStrategyPtr = std::unique_ptr<GridUpdateStrategy>;


///---------------------------------------------------------------------
/// \class MassAdditionStrategy
/// \brief Adds solution on top of the stack
/// \details The grid is rebuilt at a taller total height, regions keep
///          their temperatures, and volumes and masses are measured
///          again.
///---------------------------------------------------------------------
class MassAdditionStrategy : public GridUpdateStrategy {

public:

  explicit MassAdditionStrategy(const TransientSettings &settings);

  SolverResult advance(RegionGrid &grid, TransportSolver &solver) override;
  bool recomputesVolumes() const override { return true; }

private:

  StringVec _nuclides;
  std::vector<double> _number_densities;
  double _height_increment;

};


///---------------------------------------------------------------------
/// \class ThermalExpansionStrategy
/// \brief Lets the heated solution expand
/// \details Rows are processed from the bottom. A row above the bottom
///          is first moved rigidly so that each region sits on top of
///          the region below it, then every region of the row expands.
///          The tallest region defines the total height.
///---------------------------------------------------------------------
class ThermalExpansionStrategy : public GridUpdateStrategy {

public:

  SolverResult advance(RegionGrid &grid, TransportSolver &solver) override;
  bool recomputesVolumes() const override { return false; }

};

} // namespace soltran

#endif  // GRID_UPDATE_STRATEGY_H_
