#include "soltran/GridUpdateStrategy.h"
#include "soltran/errors.h"
#include "soltran/log.h"

namespace soltran
{


MassAdditionStrategy::MassAdditionStrategy(const TransientSettings &settings):
  _nuclides(settings.nuclides),
  _number_densities(settings.number_densities),
  _height_increment(settings.height_increment)
{
  if (!(_height_increment > 0.))
    log::raise<ConfigurationError>("Height increment must be positive, got {}",
                                   _height_increment);
}


SolverResult MassAdditionStrategy::advance(RegionGrid &grid,
                                           TransportSolver &solver) {

  auto temperatures = grid.temperatures();
  double height = grid.getTotalHeight() + _height_increment;

  grid.build(_nuclides, _number_densities, height, grid.getTotalRadius(),
             temperatures);

  log::debug("Solution height increased to {} cm", height);

  auto result = solver.query(grid, true);
  grid.applyVolumesMasses(result.volumes, result.masses);

  return result;
}


SolverResult ThermalExpansionStrategy::advance(RegionGrid &grid,
                                               TransportSolver &solver) {

  for (int i = 0; i < grid.getNumAxial(); ++i) {
    for (int j = 0; j < grid.getNumRadial(); ++j) {
      auto &r = grid.at(i, j);
      if (i > 0)
        r.shiftAxially(grid.at(i - 1, j).getHeight() - r.getBaseHeight());
      r.expand();
    }
  }

  grid.setTotalHeight(grid.maxHeight());

  log::debug("Solution expanded to {} cm", grid.getTotalHeight());

  return solver.query(grid, false);
}


} // namespace soltran
