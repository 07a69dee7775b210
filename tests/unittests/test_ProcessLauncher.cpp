/// \file test_ProcessLauncher.cpp
/// \brief Test running child processes

#include "testing/test_utils.h"
#include "soltran/errors.h"
#include "soltran/file_utils.h"
#include "soltran/ProcessLauncher.h"

#include <chrono>
#include <thread>

using namespace soltran;

namespace {

/// Testing fixture
class test_ProcessLauncher : public testing::Test {
 protected:

  double elapsedSince(std::chrono::steady_clock::time_point start) {
    std::chrono::duration<double> d = std::chrono::steady_clock::now() - start;
    return d.count();
  }

};


TEST_F(test_ProcessLauncher, rejectInvalidSettings) {
  EXPECT_THROW(ProcessLauncher(-1.), ConfigurationError);
  EXPECT_THROW(ProcessLauncher(0., nullptr, 0.), ConfigurationError);
}


TEST_F(test_ProcessLauncher, returnExitStatus) {
  ProcessLauncher launcher;

  EXPECT_EQ(0, launcher.run({"/bin/sh", "-c", "exit 0"}));
  EXPECT_EQ(3, launcher.run({"/bin/sh", "-c", "exit 3"}));
}


TEST_F(test_ProcessLauncher, searchPath) {
  ProcessLauncher launcher;
  EXPECT_EQ(0, launcher.run({"sh", "-c", "true"}));
}


TEST_F(test_ProcessLauncher, missingProgram) {
  ProcessLauncher launcher;

  EXPECT_THROW(launcher.run({"/nonexistent/soltran-solver", "case.inp"}),
               ProcessFailure);
  EXPECT_THROW(launcher.run({}), ProcessFailure);
}


TEST_F(test_ProcessLauncher, runInWorkingDirectory) {
  auto dir = testutils::makeTemporaryDirectory("soltran_launcher_");
  ASSERT_FALSE(dir.empty());

  ProcessLauncher launcher;
  EXPECT_EQ(0, launcher.run({"/bin/sh", "-c", "echo done > marker"}, dir));
  EXPECT_TRUE(fileutils::existsFile(dir + "/marker"));

  EXPECT_THROW(launcher.run({"/bin/sh", "-c", "true"}, dir + "/missing"),
               ProcessFailure);

  testutils::removeTemporaryDirectory(dir);
}


TEST_F(test_ProcessLauncher, killedBySignal) {
  ProcessLauncher launcher;
  EXPECT_THROW(launcher.run({"/bin/sh", "-c", "kill -9 $$"}), ProcessFailure);
}


TEST_F(test_ProcessLauncher, timeout) {
  ProcessLauncher launcher(0.2, nullptr, 0.01);

  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(launcher.run({"sleep", "10"}), ProcessFailure);
  EXPECT_LT(elapsedSince(start), 5.);
}


TEST_F(test_ProcessLauncher, cancelBeforeStart) {
  auto token = std::make_shared<CancellationToken>();
  token->cancel();

  ProcessLauncher launcher(0., token);
  EXPECT_THROW(launcher.run({"/bin/sh", "-c", "exit 0"}), ProcessFailure);
}


TEST_F(test_ProcessLauncher, cancelWhileRunning) {
  auto token = std::make_shared<CancellationToken>();
  ProcessLauncher launcher(0., token, 0.01);

  std::thread canceller([token]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    token->cancel();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(launcher.run({"sleep", "10"}), ProcessFailure);
  EXPECT_LT(elapsedSince(start), 5.);

  canceller.join();
}

} // namespace
