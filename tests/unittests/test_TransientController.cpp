/// \file test_TransientController.cpp
/// \brief Test the phases of a transient

#include "testing/test_utils.h"
#include "testing/ConstantProperties.h"
#include "testing/MockTransportSolver.h"
#include "soltran/constants.h"
#include "soltran/errors.h"
#include "soltran/TransientController.h"

#include <cmath>

using namespace soltran;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

namespace {

/// Keeps every record in memory
class MemoryRecorder : public ResultsRecorder {
 public:

  void writeHeader(const RegionGrid &) override { ++headers; }

  void record(const TransientState &state, const RegionGrid &) override {
    states.push_back(state);
  }

  int headers = 0;
  std::vector<TransientState> states;

};


/// Testing fixture
class test_TransientController : public testing::Test {
 protected:

  void SetUp() override {
    settings.nuclides = {"u-235"};
    settings.number_densities = {1.E-4};
    settings.height = 10.;
    settings.radius = 4.;
    settings.num_axial = 1;
    settings.num_radial = 2;
    settings.height_increment = 1.;
    settings.timestep_magnitude = -3;
    settings.source = 1.E10;
    settings.keff_ceiling = 1.01;
    settings.keff_floor = 1.0;

    solver = std::make_shared<MockTransportSolver>();
    recorder = std::make_shared<MemoryRecorder>();
  }

  std::unique_ptr<TransientController> makeController(CancellationTokenPtr token = nullptr) {
    return std::unique_ptr<TransientController>(
      new TransientController(settings, solver, ConstantProperties::create(),
                              {recorder}, token));
  }

  /// A result with volumes and masses of both regions
  SolverResult makeResult(double keff, double nubar = 2.5,
                          std::vector<double> profile = {0.25, 0.75},
                          double lifetime = 1.E-4) {
    SolverResult r;
    r.keff = keff;
    r.keff_sigma = 0.001;
    r.keff_max = keff + 0.002;
    r.lifetime = lifetime;
    r.nubar = nubar;
    r.volumes = {100., 200.};
    r.masses = {1000., 2000.};
    r.fission_profile = profile;
    return r;
  }

  /// Temperature rise of a region receiving some fissions
  double heating(double fissions, double mass) {
    return fissions * ENERGY_PER_FISSION * JOULES_PER_MEV / (mass / 1000.) / 4186.;
  }

  TransientSettings settings;
  std::shared_ptr<MockTransportSolver> solver;
  std::shared_ptr<MemoryRecorder> recorder;

};


TEST_F(test_TransientController, rejectInvalidSettings) {
  settings.keff_ceiling = 0.99;
  EXPECT_THROW(makeController(), ConfigurationError);

  settings.keff_ceiling = 1.01;
  settings.timestep_magnitude = 0;
  EXPECT_THROW(makeController(), ConfigurationError);

  settings.timestep_magnitude = -3;
  settings.max_steps = -1;
  EXPECT_THROW(makeController(), ConfigurationError);
}


TEST_F(test_TransientController, rejectMissingCollaborators) {
  EXPECT_THROW(TransientController(settings, nullptr, ConstantProperties::create()),
               std::logic_error);
  EXPECT_THROW(TransientController(settings, solver, nullptr),
               std::logic_error);
}


TEST_F(test_TransientController, initializeBaseline) {
  EXPECT_CALL(*solver, query(_, true))
    .WillOnce(Return(makeResult(0.9)));

  auto controller = makeController();
  EXPECT_EQ(+transientPhase::Initializing, controller->getPhase());

  controller->initialize();

  EXPECT_EQ(+transientPhase::AccumulationPhase, controller->getPhase());

  auto &state = controller->getState();
  EXPECT_EQ(0, state.tick);
  EXPECT_DOUBLE_EQ(0., state.time);
  EXPECT_DOUBLE_EQ(1.E10, state.population);
  EXPECT_DOUBLE_EQ(4.E9, state.cumulative_fissions);
  EXPECT_DOUBLE_EQ(300., state.max_temperature);

  EXPECT_DOUBLE_EQ(200., controller->getGrid().region(2).getVolume());
  EXPECT_DOUBLE_EQ(2000., controller->getGrid().region(2).getMass());

  EXPECT_EQ(1, recorder->headers);
  ASSERT_EQ(1u, recorder->states.size());
  EXPECT_EQ(+transientPhase::Initializing, recorder->states[0].phase);

  EXPECT_ANY_THROW(controller->initialize());
}


TEST_F(test_TransientController, stepBeforeInitialize) {
  auto controller = makeController();
  EXPECT_THROW(controller->step(), std::logic_error);
}


TEST_F(test_TransientController, baselineAboveCeiling) {
  EXPECT_CALL(*solver, query(_, true))
    .WillOnce(Return(makeResult(1.02)));

  auto controller = makeController();
  controller->initialize();

  EXPECT_EQ(+transientPhase::ExpansionPhase, controller->getPhase());
}


TEST_F(test_TransientController, baselineAtFloor) {
  settings.keff_ceiling = 1.0;

  EXPECT_CALL(*solver, query(_, true))
    .WillOnce(Return(makeResult(1.0)));

  auto controller = makeController();
  controller->initialize();

  EXPECT_EQ(+transientPhase::Terminated, controller->getPhase());
  EXPECT_FALSE(controller->step());
}


TEST_F(test_TransientController, nonPositiveNubarInBaseline) {
  EXPECT_CALL(*solver, query(_, true))
    .WillOnce(Return(makeResult(0.9, 0.)));

  auto controller = makeController();
  EXPECT_THROW(controller->initialize(), InvariantViolation);
  EXPECT_EQ(+transientPhase::Aborted, controller->getPhase());
  EXPECT_TRUE(recorder->states.empty());
}


TEST_F(test_TransientController, accumulateUntilCeiling) {
  std::vector<double> heights;
  auto recordHeight = [&](double keff) {
    return [&heights, keff, this](const RegionGrid &g, bool) {
      heights.push_back(g.getTotalHeight());
      return makeResult(keff);
    };
  };

  {
    InSequence s;
    EXPECT_CALL(*solver, query(_, true))
      .WillOnce(Invoke(recordHeight(0.9)))
      .WillOnce(Invoke(recordHeight(1.0)))
      .WillOnce(Invoke(recordHeight(1.01)));
    EXPECT_CALL(*solver, query(_, false))
      .WillOnce(Return(makeResult(1.005)));
  }

  auto controller = makeController();
  controller->initialize();

  EXPECT_TRUE(controller->step());
  EXPECT_EQ(+transientPhase::AccumulationPhase, controller->getPhase());

  // k-eff reaching the ceiling ends the accumulation
  EXPECT_TRUE(controller->step());
  EXPECT_EQ(+transientPhase::ExpansionPhase, controller->getPhase());

  EXPECT_EQ(std::vector<double>({10., 11., 12.}), heights);
  EXPECT_DOUBLE_EQ(12., controller->getGrid().getTotalHeight());

  EXPECT_TRUE(controller->step());
  EXPECT_EQ(+transientPhase::ExpansionPhase, controller->getPhase());
  EXPECT_EQ(3, controller->getState().tick);
  EXPECT_DOUBLE_EQ(0.003, controller->getState().time);
}


TEST_F(test_TransientController, expandUntilFloor) {
  {
    InSequence s;
    EXPECT_CALL(*solver, query(_, true))
      .WillOnce(Return(makeResult(1.02)));
    EXPECT_CALL(*solver, query(_, false))
      .WillOnce(Return(makeResult(1.01)))
      .WillOnce(Return(makeResult(1.0)));
  }

  auto controller = makeController();
  auto &state = controller->run();

  EXPECT_EQ(+transientPhase::Terminated, state.phase);
  EXPECT_EQ(2, state.tick);
  EXPECT_TRUE(controller->isFinished());

  ASSERT_EQ(3u, recorder->states.size());
  EXPECT_EQ(+transientPhase::ExpansionPhase, recorder->states[2].phase);
  EXPECT_DOUBLE_EQ(1.0, recorder->states[2].keff);

  // Heated regions expand
  EXPECT_GT(controller->getGrid().getTotalHeight(), 10.);
}


TEST_F(test_TransientController, heatWithPreviousResult) {
  {
    InSequence s;
    EXPECT_CALL(*solver, query(_, true))
      .WillOnce(Return(makeResult(1.0, 2.5, {0.25, 0.75}, 1.E-4)))
      .WillOnce(Return(makeResult(1.005, 2.0, {0.5, 0.5}, 1.E-3)))
      .WillOnce(Return(makeResult(1.0, 2.0, {0.5, 0.5}, 1.E-3)));
  }

  auto controller = makeController();
  controller->initialize();

  // The first tick uses the baseline k-eff, nu-bar and profile
  controller->step();
  auto &s1 = controller->getState();

  EXPECT_DOUBLE_EQ(1.E10, s1.population);
  ASSERT_EQ(2u, s1.region_fissions.size());
  EXPECT_DOUBLE_EQ(1.E9, s1.region_fissions[0]);
  EXPECT_DOUBLE_EQ(3.E9, s1.region_fissions[1]);
  EXPECT_DOUBLE_EQ(4.E9, s1.tick_fissions);
  EXPECT_DOUBLE_EQ(8.E9, s1.cumulative_fissions);

  // The result obtained during the tick is recorded
  EXPECT_DOUBLE_EQ(1.005, s1.keff);
  EXPECT_DOUBLE_EQ(2.0, s1.nubar);

  auto &grid = controller->getGrid();
  EXPECT_DOUBLE_EQ(300. + heating(1.E9, 1000.), grid.region(1).getTemperature());
  EXPECT_DOUBLE_EQ(300. + heating(3.E9, 2000.), grid.region(2).getTemperature());
  EXPECT_DOUBLE_EQ(300. + heating(3.E9, 2000.), s1.max_temperature);

  // The second tick uses the result of the first one
  controller->step();
  auto &s2 = controller->getState();

  double population = 1.E10 * std::exp((1.005 - 1.) / 1.E-3 * 1.E-3);
  EXPECT_DOUBLE_EQ(population, s2.population);
  EXPECT_DOUBLE_EQ(population / 4., s2.region_fissions[0]);
  EXPECT_DOUBLE_EQ(population / 4., s2.region_fissions[1]);
  EXPECT_DOUBLE_EQ(8.E9 + population / 2., s2.cumulative_fissions);
}


TEST_F(test_TransientController, stopAtMaxSteps) {
  settings.max_steps = 2;

  EXPECT_CALL(*solver, query(_, true))
    .Times(3)
    .WillRepeatedly(Return(makeResult(0.9)));

  auto controller = makeController();
  auto &state = controller->run();

  EXPECT_EQ(+transientPhase::Terminated, state.phase);
  EXPECT_EQ(2, state.tick);
  EXPECT_EQ(3u, recorder->states.size());
}


TEST_F(test_TransientController, abortOnSolverFailure) {
  {
    InSequence s;
    EXPECT_CALL(*solver, query(_, true))
      .WillOnce(Return(makeResult(0.9)))
      .WillOnce(Throw(ProcessFailure("solver crashed")));
  }

  auto controller = makeController();

  EXPECT_THROW(controller->run(), ProcessFailure);
  EXPECT_EQ(+transientPhase::Aborted, controller->getPhase());
  EXPECT_EQ(0, controller->getState().tick);

  // Nothing is recorded for the failed tick
  EXPECT_EQ(1u, recorder->states.size());
  EXPECT_FALSE(controller->step());
}


TEST_F(test_TransientController, abortOnZeroLifetime) {
  {
    InSequence s;
    EXPECT_CALL(*solver, query(_, true))
      .WillOnce(Return(makeResult(0.9)))
      .WillOnce(Return(makeResult(0.9, 2.5, {0.25, 0.75}, 0.)));
  }

  auto controller = makeController();
  controller->initialize();

  EXPECT_THROW(controller->step(), InvariantViolation);
  EXPECT_EQ(+transientPhase::Aborted, controller->getPhase());
  EXPECT_EQ(0, controller->getState().tick);

  // The invalid tick is never recorded
  ASSERT_EQ(1u, recorder->states.size());
  EXPECT_DOUBLE_EQ(0., recorder->states.back().time);
  EXPECT_FALSE(controller->step());
}


TEST_F(test_TransientController, abortOnZeroNubar) {
  {
    InSequence s;
    EXPECT_CALL(*solver, query(_, true))
      .WillOnce(Return(makeResult(0.9)))
      .WillOnce(Return(makeResult(0.9, 0.)));
  }

  auto controller = makeController();
  controller->initialize();
  auto temperature = controller->getGrid().maxTemperature();

  EXPECT_THROW(controller->step(), InvariantViolation);
  EXPECT_EQ(+transientPhase::Aborted, controller->getPhase());
  EXPECT_EQ(1u, recorder->states.size());

  // No region was heated by the rejected tick
  EXPECT_DOUBLE_EQ(temperature, controller->getGrid().maxTemperature());
}


TEST_F(test_TransientController, abortOnUndefinedKeff) {
  {
    InSequence s;
    EXPECT_CALL(*solver, query(_, true))
      .WillOnce(Return(makeResult(0.9)))
      .WillOnce(Return(makeResult(NAN)));
  }

  auto controller = makeController();
  controller->initialize();

  EXPECT_THROW(controller->step(), InvariantViolation);
  EXPECT_EQ(+transientPhase::Aborted, controller->getPhase());
  EXPECT_EQ(1u, recorder->states.size());
}


TEST_F(test_TransientController, cancelBeforeTick) {
  auto token = std::make_shared<CancellationToken>();

  EXPECT_CALL(*solver, query(_, true))
    .WillOnce(Return(makeResult(0.9)));

  auto controller = makeController(token);
  controller->initialize();

  token->cancel();

  EXPECT_THROW(controller->step(), ProcessFailure);
  EXPECT_EQ(+transientPhase::Aborted, controller->getPhase());
  EXPECT_EQ(1u, recorder->states.size());
}


TEST_F(test_TransientController, cancelBeforeBaseline) {
  auto token = std::make_shared<CancellationToken>();
  token->cancel();

  EXPECT_CALL(*solver, query(_, _)).Times(0);

  auto controller = makeController(token);
  EXPECT_THROW(controller->run(), ProcessFailure);
  EXPECT_EQ(+transientPhase::Aborted, controller->getPhase());
}

} // namespace
