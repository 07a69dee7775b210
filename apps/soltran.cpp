#include "soltran/CancellationToken.h"
#include "soltran/ConfigInputFile.h"
#include "soltran/errors.h"
#include "soltran/Factory.h"
#include "soltran/log.h"
#include "soltran/Timer.h"

#include <csignal>
#include <cstdio>

using namespace soltran;

void printTimerReport(Timer &);
void installSignalHandlers(CancellationTokenPtr);

/// The token raised by SIGINT and SIGTERM
static CancellationToken *signal_token = nullptr;

extern "C" void handleSignal(int) {
  if (signal_token)
    signal_token->cancel();
}


int main(int argc, char *argv[])
{

  Timer timer;
  timer.startTimer();

  auto token = std::make_shared<CancellationToken>();
  installSignalHandlers(token);

  try {
    //------------------------------------------------------------
    // Read simulation arguments
    //------------------------------------------------------------
    timer.startTimer();

    auto conf = Factory::getConfInput<ConfigInputFile>(argc, argv);

    // Print the help message when needed
    if (argc < 2)
    {
      conf->showHelp();
    }
    else
    {
      conf->showHelpAsNeeded();
    }

    // Set log level
    conf->initializeLogger();

    // Print the title
    log::title("SOLTRAN: transient criticality of fissile solutions");

    // Report input arguments
    conf->printArgumentsReport();

    // Validate input parameters
    conf->validateArguments();

    timer.stopTimer("Read Settings");

    //------------------------------------------------------------
    // Run the transient
    //------------------------------------------------------------
    auto controller = Factory::getController(conf, token);

    timer.startTimer();
    auto &state = controller->run();
    timer.stopTimer("Transient");

    log::result("Final time = {:.{}f} s, cumulative fissions = {:E}, "
                "max temperature = {} K", state.time,
                controller->getSettings().timeDecimals(),
                state.cumulative_fissions, state.max_temperature);
  }
  catch (const Error &e) {
    std::fprintf(stderr, "soltran: %s\n", e.what());
    return 1;
  }

  timer.stopTimer("Total");
  printTimerReport(timer);

  log::header("Finished");

  return 0;
}

//----------------------------------------------------------------------
// Helpers
//----------------------------------------------------------------------
/// \brief Print a timing report of the run
void printTimerReport(Timer &timer)
{

  log::header("Timing Report");

  const std::string tot_string = "Total";
  timer.printSplit(tot_string, "Total Time");

  timer.printSplit("Read Settings", "Time to read settings",
                   1, tot_string);

  timer.printSplit("Transient", "Time of the transient",
                   1, tot_string);

  timer.printSplit("Transport solver", "Time spent in the external solver",
                   2, "Transient");

  log::separator("-");
}


/// \brief Let SIGINT and SIGTERM cancel the run
void installSignalHandlers(CancellationTokenPtr token)
{
  signal_token = token.get();
  std::signal(SIGINT, handleSignal);
  std::signal(SIGTERM, handleSignal);
}
