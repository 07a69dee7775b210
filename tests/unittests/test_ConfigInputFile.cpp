/// \file test_ConfigInputFile.cpp
/// \brief Test settings files in TOML and XML

#include "testing/test_utils.h"
#include "soltran/ConfigInputFile.h"
#include "soltran/errors.h"

using namespace soltran;

namespace {

/// Testing fixture
class test_ConfigInputFile : public testing::Test {
 protected:

  void SetUp() override {
    dir = testutils::makeTemporaryDirectory("soltran_settings_");
    ASSERT_FALSE(dir.empty());
  }

  void TearDown() override {
    testutils::removeTemporaryDirectory(dir);
  }

  /// Checks the options set by both settings files
  void checkSettings(ConfigInputFile &input) {
    EXPECT_EQ(+log::level::debug, input.getLogLevel());
    EXPECT_EQ("uranyl.inp", input.getCaseName());
    EXPECT_EQ("out", input.getOutputDirectory());
    EXPECT_TRUE(input.doesDumpRegions());
    EXPECT_EQ(StringVec({"h", "o", "u-235"}), input.getNuclides());
    EXPECT_EQ(std::vector<double>({6.0e-2, 3.0e-2, 1.0e-4}), input.getNumberDensities());
    EXPECT_TRUE(input.doesComputeMassFromDensity());
    EXPECT_DOUBLE_EQ(40.5, input.getHeight());
    EXPECT_EQ(2, input.getNumAxialRegions());
    EXPECT_EQ(-4, input.getTimestepMagnitude());
    EXPECT_DOUBLE_EQ(1.02, input.getKeffCeiling());
    EXPECT_EQ("csas6 -m", input.getSolverCommand());
    EXPECT_EQ(2, input.getSolverRetries());

    // Options absent from the file keep their defaults
    EXPECT_DOUBLE_EQ(15., input.getRadius());
    EXPECT_EQ(406, input.getGenerations());

    EXPECT_NO_THROW(input.validateArguments());
  }

  std::string dir;

};


TEST_F(test_ConfigInputFile, readTOML) {
  auto file = dir + "/settings.toml";
  testutils::writeTextFile(file,
    "log_level = \"debug\"\n"
    "\n"
    "[case]\n"
    "name = \"uranyl\"\n"
    "\n"
    "[output]\n"
    "directory = \"out\"\n"
    "dump_regions = true\n"
    "\n"
    "[solution]\n"
    "nuclides = [\"h\", \"o\", \"u-235\"]\n"
    "number_densities = [6.0e-2, 3.0e-2, 1.0e-4]\n"
    "mass_from_density = true\n"
    "\n"
    "[geometry]\n"
    "height = 40.5\n"
    "axial_regions = 2\n"
    "\n"
    "[kinetics]\n"
    "timestep_magnitude = -4\n"
    "keff_ceiling = 1.02\n"
    "\n"
    "[solver]\n"
    "command = \"csas6 -m\"\n"
    "retries = 2\n");

  ConfigInputFile input({"-c", file});
  checkSettings(input);
}


TEST_F(test_ConfigInputFile, readXML) {
  auto file = dir + "/settings.xml";
  testutils::writeTextFile(file,
    "<?xml version=\"1.0\"?>\n"
    "<settings log_level=\"debug\">\n"
    "  <case name=\"uranyl\"/>\n"
    "  <output>\n"
    "    <directory>out</directory>\n"
    "    <dump_regions>true</dump_regions>\n"
    "  </output>\n"
    "  <solution nuclides=\"h, o, u-235\" mass_from_density=\"true\">\n"
    "    <number_densities>6.0e-2, 3.0e-2, 1.0e-4</number_densities>\n"
    "  </solution>\n"
    "  <geometry height=\"40.5\" axial_regions=\"2\"/>\n"
    "  <kinetics timestep_magnitude=\"-4\" keff_ceiling=\"1.02\"/>\n"
    "  <solver command=\"csas6 -m\" retries=\"2\"/>\n"
    "</settings>\n");

  ConfigInputFile input({"-c", file});
  checkSettings(input);
}


TEST_F(test_ConfigInputFile, commandLineTakesPrecedence) {
  auto file = dir + "/settings.toml";
  testutils::writeTextFile(file,
    "[case]\n"
    "name = \"uranyl\"\n"
    "[geometry]\n"
    "height = 40.5\n");

  ConfigInputFile input({"-c", file, "--height", "50", "--case", "other"});

  EXPECT_DOUBLE_EQ(50., input.getHeight());
  EXPECT_EQ("other.inp", input.getCaseName());
}


TEST_F(test_ConfigInputFile, missingSettingsFile) {
  EXPECT_THROW(ConfigInputFile({"-c", dir + "/missing.toml"}), ConfigurationError);
}


TEST_F(test_ConfigInputFile, malformedTOML) {
  auto file = dir + "/settings.toml";
  testutils::writeTextFile(file, "[case\nname = \n");

  EXPECT_THROW(ConfigInputFile({"-c", file}), ConfigurationError);
}


TEST_F(test_ConfigInputFile, behaveAsCLIWithoutFile) {
  ConfigInputFile input({"--case", "case", "--radius", "20"});

  EXPECT_EQ("case.inp", input.getCaseName());
  EXPECT_DOUBLE_EQ(20., input.getRadius());
}

} // namespace
