/// \file test_MaterialRegion.cpp
/// \brief Test material regions

#include "testing/test_utils.h"
#include "testing/ConstantProperties.h"
#include "soltran/errors.h"
#include "soltran/MaterialRegion.h"

#include <cmath>

using namespace soltran;

namespace {

/// Testing fixture
class test_MaterialRegion : public testing::Test {
 protected:

  MaterialRegion makeRegion(double height = 10., double base_height = 0.) {
    return MaterialRegion(1, {"h", "u-235"}, {6.E-2, 2.E-4}, 300., 5.,
                          height, base_height, ConstantProperties::create());
  }

};


TEST_F(test_MaterialRegion, rejectInvalidConstruction) {
  auto props = ConstantProperties::create();

  EXPECT_THROW(MaterialRegion(0, {"h"}, {1.}, 300., 5., 10., 0., props),
               InvariantViolation);
  EXPECT_THROW(MaterialRegion(1, {"h", "o"}, {1.}, 300., 5., 10., 0., props),
               ConfigurationError);
  EXPECT_THROW(MaterialRegion(1, {"h"}, {1.}, 300., 0., 10., 0., props),
               InvariantViolation);
  EXPECT_THROW(MaterialRegion(1, {"h"}, {1.}, 300., 5., 10., 10., props),
               InvariantViolation);
}


TEST_F(test_MaterialRegion, establishVolumeOnce) {
  auto r = makeRegion();

  EXPECT_FALSE(r.hasVolume());
  r.setInitialVolumeMass(100., 116.1);

  EXPECT_TRUE(r.hasVolume());
  EXPECT_DOUBLE_EQ(100., r.getVolume());
  EXPECT_DOUBLE_EQ(116.1, r.getMass());
  EXPECT_DOUBLE_EQ(10., r.getBaseArea());
  EXPECT_DOUBLE_EQ(6.E-2 * 1.E24 * 100., r.getAtoms()[0]);

  EXPECT_THROW(r.setInitialVolumeMass(100., 116.1), InvariantViolation);
}


TEST_F(test_MaterialRegion, rejectNonPositiveVolumeOrMass) {
  auto r = makeRegion();
  EXPECT_THROW(r.setInitialVolumeMass(0., 1.), InvariantViolation);
  EXPECT_THROW(r.setInitialVolumeMass(1., -1.), InvariantViolation);
}


TEST_F(test_MaterialRegion, setHeightRescalesDensities) {
  auto r = makeRegion();
  r.setInitialVolumeMass(100., 116.1);

  r.setHeight(12.);

  EXPECT_DOUBLE_EQ(12., r.getHeight());
  EXPECT_DOUBLE_EQ(120., r.getVolume());
  EXPECT_NEAR(6.E-2 * 100. / 120., r.getNumberDensities()[0], 1.E-15);
  EXPECT_NEAR(2.E-4 * 100. / 120., r.getNumberDensities()[1], 1.E-18);
}


TEST_F(test_MaterialRegion, conserveAtomsOverHeightChanges) {
  auto r = makeRegion();
  r.setInitialVolumeMass(100., 116.1);
  auto atoms = r.getAtoms();

  for (double h : {11., 10.5, 13.25, 10.01, 20.}) {
    r.setHeight(h);
    for (size_t i = 0; i < atoms.size(); ++i) {
      double current = r.getNumberDensities()[i] * 1.E24 * r.getVolume();
      EXPECT_NEAR(1., current / atoms[i], 1.E-12);
    }
  }
}


TEST_F(test_MaterialRegion, rejectHeightBelowBase) {
  auto r = makeRegion(20., 10.);
  EXPECT_THROW(r.setHeight(15.), InvariantViolation);

  r.setInitialVolumeMass(100., 116.1);
  EXPECT_THROW(r.setHeight(10.), InvariantViolation);
  EXPECT_THROW(r.setHeight(5.), InvariantViolation);
}


TEST_F(test_MaterialRegion, upperRegionUsesExtentForBaseArea) {
  auto r = makeRegion(20., 10.);
  r.setInitialVolumeMass(100., 116.1);

  EXPECT_DOUBLE_EQ(10., r.getBaseArea());

  r.setHeight(21.);
  EXPECT_DOUBLE_EQ(110., r.getVolume());
}


TEST_F(test_MaterialRegion, shiftKeepsExtent) {
  auto r = makeRegion(20., 10.);
  r.setInitialVolumeMass(100., 116.1);

  r.shiftAxially(2.5);

  EXPECT_DOUBLE_EQ(12.5, r.getBaseHeight());
  EXPECT_DOUBLE_EQ(22.5, r.getHeight());
  EXPECT_DOUBLE_EQ(100., r.getVolume());
}


TEST_F(test_MaterialRegion, heatUpWithConstantSpecificHeat) {
  auto r = makeRegion();
  r.setInitialVolumeMass(100., 1000.);

  // 1e12 fissions of 180 MeV into 1 kg of cp = 4186
  r.heatUp(1.E12);

  double expected = 1.E12 * 180. * 1.6022E-13 / 1. / 4186.;
  EXPECT_NEAR(300. + expected, r.getTemperature(), 1.E-9);
  EXPECT_NEAR(expected, r.getDeltaTemperature(), 1.E-9);
}


TEST_F(test_MaterialRegion, rejectInvalidHeating) {
  auto r = makeRegion();
  EXPECT_THROW(r.heatUp(1.), InvariantViolation);

  r.setInitialVolumeMass(100., 1000.);
  EXPECT_THROW(r.heatUp(-1.), InvariantViolation);
  EXPECT_THROW(r.heatUp(NAN), InvariantViolation);
}


TEST_F(test_MaterialRegion, expandByTemperatureRise) {
  MaterialRegion r(1, {"h"}, {6.E-2}, 300., 5., 10., 0.,
                   ConstantProperties::create(4186., 1.E-3));
  r.setInitialVolumeMass(100., 1000.);

  r.heatUp(1.E12);
  double dT = r.getDeltaTemperature();

  r.expand();

  // dh = dT * V * alpha / A
  EXPECT_NEAR(10. + dT * 100. * 1.E-3 / 10., r.getHeight(), 1.E-12);
}


TEST_F(test_MaterialRegion, expandWithoutHeatingKeepsHeight) {
  auto r = makeRegion();
  r.setInitialVolumeMass(100., 1000.);

  r.expand();
  EXPECT_DOUBLE_EQ(10., r.getHeight());
}


TEST_F(test_MaterialRegion, records) {
  auto r = makeRegion(20., 10.);

  auto g = r.geometryRecord();
  EXPECT_EQ(1, g.id);
  EXPECT_DOUBLE_EQ(5., g.radius);
  EXPECT_DOUBLE_EQ(20., g.height);
  EXPECT_DOUBLE_EQ(10., g.base_height);

  auto c = r.compositionRecord();
  ASSERT_EQ(2u, c.size());
  EXPECT_EQ("u-235", c[1].label);
  EXPECT_EQ(1, c[1].region_id);
  EXPECT_DOUBLE_EQ(2.E-4, c[1].number_density);
  EXPECT_DOUBLE_EQ(300., c[1].temperature);
}

} // namespace
