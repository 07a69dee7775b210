/// \file test_GridUpdateStrategy.cpp
/// \brief Test the grid updates of the accumulation and expansion phases

#include "testing/test_utils.h"
#include "testing/ConstantProperties.h"
#include "testing/MockTransportSolver.h"
#include "soltran/errors.h"
#include "soltran/GridUpdateStrategy.h"

using namespace soltran;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

/// Testing fixture
class test_GridUpdateStrategy : public testing::Test {
 protected:

  void SetUp() override {
    settings.nuclides = {"u-235"};
    settings.number_densities = {1.E-4};
    settings.height_increment = 1.;

    grid.build(settings.nuclides, settings.number_densities, 20., 4.);
    grid.applyVolumesMasses({100., 100.}, {100., 100.});
  }

  SolverResult makeResult(std::vector<double> volumes = {},
                          std::vector<double> masses = {}) {
    SolverResult r;
    r.keff = 1.;
    r.lifetime = 1.E-4;
    r.nubar = 2.5;
    r.volumes = volumes;
    r.masses = masses;
    r.fission_profile = {0.5, 0.5};
    return r;
  }

  TransientSettings settings;
  RegionGrid grid {2, 1, ConstantProperties::create()};
  MockTransportSolver solver;

};


TEST_F(test_GridUpdateStrategy, rejectNonPositiveIncrement) {
  settings.height_increment = 0.;
  EXPECT_THROW(MassAdditionStrategy strategy(settings), ConfigurationError);
}


TEST_F(test_GridUpdateStrategy, addMass) {
  MassAdditionStrategy strategy(settings);
  EXPECT_TRUE(strategy.recomputesVolumes());

  grid.region(1).heatUp(1.E15);
  auto t1 = grid.region(1).getTemperature();

  double queried_height = 0.;
  EXPECT_CALL(solver, query(_, true))
    .WillOnce(Invoke([&](const RegionGrid &g, bool) {
      queried_height = g.getTotalHeight();
      return makeResult({105., 105.}, {121.9, 121.9});
    }));

  auto result = strategy.advance(grid, solver);

  EXPECT_DOUBLE_EQ(21., queried_height);
  EXPECT_DOUBLE_EQ(21., grid.getTotalHeight());
  EXPECT_DOUBLE_EQ(10.5, grid.region(1).getHeight());
  EXPECT_DOUBLE_EQ(10.5, grid.region(2).getBaseHeight());

  // Fresh regions keep the temperatures of the old ones
  EXPECT_DOUBLE_EQ(t1, grid.region(1).getTemperature());
  EXPECT_DOUBLE_EQ(300., grid.region(2).getTemperature());

  EXPECT_DOUBLE_EQ(105., grid.region(2).getVolume());
  EXPECT_DOUBLE_EQ(121.9, grid.region(2).getMass());
  EXPECT_DOUBLE_EQ(2.5, result.nubar);
}


TEST_F(test_GridUpdateStrategy, addMassWithoutVolumes) {
  MassAdditionStrategy strategy(settings);

  EXPECT_CALL(solver, query(_, true))
    .WillOnce(Return(makeResult()));

  EXPECT_THROW(strategy.advance(grid, solver), DataUnavailable);
}


TEST_F(test_GridUpdateStrategy, expandBottomUp) {
  ThermalExpansionStrategy strategy;
  EXPECT_FALSE(strategy.recomputesVolumes());

  grid.region(1).heatUp(1.E15);
  grid.region(2).heatUp(2.E15);

  // Base area is 10 cm^2, alpha is 2E-4 1/K
  auto dh1 = grid.region(1).getDeltaTemperature() * 100. * 2.E-4 / 10.;
  auto dh2 = grid.region(2).getDeltaTemperature() * 100. * 2.E-4 / 10.;
  ASSERT_GT(dh1, 0.);

  EXPECT_CALL(solver, query(_, false))
    .WillOnce(Return(makeResult()));

  strategy.advance(grid, solver);

  EXPECT_DOUBLE_EQ(0., grid.region(1).getBaseHeight());
  EXPECT_DOUBLE_EQ(10. + dh1, grid.region(1).getHeight());

  // The upper region sits on the expanded lower one
  EXPECT_DOUBLE_EQ(10. + dh1, grid.region(2).getBaseHeight());
  EXPECT_DOUBLE_EQ(20. + dh1 + dh2, grid.region(2).getHeight());
  EXPECT_DOUBLE_EQ(grid.region(2).getHeight(), grid.getTotalHeight());

  // Atoms are conserved
  EXPECT_NEAR(1.E-4 * 100. / grid.region(2).getVolume(),
              grid.region(2).getNumberDensities()[0], 1.E-16);
}


TEST_F(test_GridUpdateStrategy, expandWithoutHeating) {
  ThermalExpansionStrategy strategy;

  EXPECT_CALL(solver, query(_, false))
    .WillOnce(Return(makeResult()));

  strategy.advance(grid, solver);

  EXPECT_DOUBLE_EQ(10., grid.region(1).getHeight());
  EXPECT_DOUBLE_EQ(20., grid.getTotalHeight());
  EXPECT_DOUBLE_EQ(100., grid.region(2).getVolume());
}

} // namespace
