/// \file test_RegionGrid.cpp
/// \brief Test the axial-radial grid of regions

#include "testing/test_utils.h"
#include "testing/ConstantProperties.h"
#include "soltran/errors.h"
#include "soltran/RegionGrid.h"

using namespace soltran;

namespace {

/// Testing fixture
class test_RegionGrid : public testing::Test {
 protected:

  StringVec nuclides = {"h", "n", "o", "u-234", "u-235", "u-236", "u-238"};
  std::vector<double> ndens = {6.258e-2, 1.569e-3, 3.576e-2, 1.060e-6,
                               1.686e-4, 4.350e-7, 1.170e-5};

  RegionGrid grid {4, 3, ConstantProperties::create()};

};


TEST_F(test_RegionGrid, rejectEmptyShape) {
  EXPECT_THROW(RegionGrid(0, 3, ConstantProperties::create()), ConfigurationError);
  EXPECT_THROW(RegionGrid(4, 0, ConstantProperties::create()), ConfigurationError);
}


TEST_F(test_RegionGrid, rowHeightsAndColumnRadii) {
  auto heights = RegionGrid::rowHeights(4, 53.);
  ASSERT_EQ(4u, heights.size());
  EXPECT_DOUBLE_EQ(13.25, heights[0]);
  EXPECT_DOUBLE_EQ(26.5, heights[1]);
  EXPECT_DOUBLE_EQ(39.75, heights[2]);
  EXPECT_DOUBLE_EQ(53., heights[3]);

  auto radii = RegionGrid::columnRadii(3, 15.);
  ASSERT_EQ(3u, radii.size());
  EXPECT_DOUBLE_EQ(5., radii[0]);
  EXPECT_DOUBLE_EQ(10., radii[1]);
  EXPECT_DOUBLE_EQ(15., radii[2]);
}


TEST_F(test_RegionGrid, buildReferenceGrid) {
  grid.build(nuclides, ndens, 53., 15.);

  ASSERT_EQ(12u, grid.size());
  EXPECT_DOUBLE_EQ(53., grid.getTotalHeight());
  EXPECT_DOUBLE_EQ(15., grid.getTotalRadius());

  int id = 1;
  for (const auto &r : grid)
    EXPECT_EQ(id++, r.getId());

  // Row-major, bottom row first, inner column first
  EXPECT_EQ(5, grid.at(1, 1).getId());
  EXPECT_DOUBLE_EQ(26.5, grid.at(1, 1).getHeight());
  EXPECT_DOUBLE_EQ(13.25, grid.at(1, 1).getBaseHeight());
  EXPECT_DOUBLE_EQ(10., grid.at(1, 1).getRadius());

  EXPECT_DOUBLE_EQ(0., grid.region(3).getBaseHeight());
  EXPECT_DOUBLE_EQ(15., grid.region(3).getRadius());
  EXPECT_DOUBLE_EQ(53., grid.region(12).getHeight());

  for (const auto &r : grid)
    EXPECT_DOUBLE_EQ(300., r.getTemperature());
}


TEST_F(test_RegionGrid, buildCarriesTemperatures) {
  std::vector<double> temps;
  for (int i = 0; i < 12; ++i)
    temps.push_back(300. + i);

  grid.build(nuclides, ndens, 54., 15.);
  grid.build(nuclides, ndens, 55., 15., temps);

  EXPECT_EQ(temps, grid.temperatures());
  EXPECT_DOUBLE_EQ(311., grid.maxTemperature());
  EXPECT_DOUBLE_EQ(55., grid.maxHeight());
}


TEST_F(test_RegionGrid, rejectInvalidBuild) {
  EXPECT_THROW(grid.build(nuclides, {1.}, 53., 15.), ConfigurationError);
  EXPECT_THROW(grid.build(nuclides, ndens, 0., 15.), InvariantViolation);
  EXPECT_THROW(grid.build(nuclides, ndens, 53., -1.), InvariantViolation);
  EXPECT_THROW(grid.build(nuclides, ndens, 53., 15., {300.}), InvariantViolation);
}


TEST_F(test_RegionGrid, applyVolumesMasses) {
  grid.build(nuclides, ndens, 53., 15.);

  std::vector<double> volumes(12, 100.), masses(12, 116.1);
  grid.applyVolumesMasses(volumes, masses);

  for (const auto &r : grid) {
    EXPECT_TRUE(r.hasVolume());
    EXPECT_DOUBLE_EQ(116.1, r.getMass());
  }

  grid.build(nuclides, ndens, 54., 15.);
  EXPECT_THROW(grid.applyVolumesMasses({1., 2.}, {1., 2.}), DataUnavailable);
}


TEST_F(test_RegionGrid, rowAccess) {
  grid.build(nuclides, ndens, 53., 15.);

  auto top = grid.row(3);
  ASSERT_EQ(3u, top.size());
  EXPECT_EQ(10, top[0]->getId());
  EXPECT_EQ(12, top[2]->getId());
}


TEST_F(test_RegionGrid, outOfRangeAccess) {
  grid.build(nuclides, ndens, 53., 15.);

  EXPECT_THROW(grid.region(0), std::logic_error);
  EXPECT_THROW(grid.region(13), std::logic_error);
  EXPECT_THROW(grid.at(4, 0), std::logic_error);
  EXPECT_THROW(grid.at(0, 3), std::logic_error);
}

} // namespace
