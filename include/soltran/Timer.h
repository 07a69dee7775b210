/// \file Timer.h
/// \brief A stopwatch with named splits.

#ifndef TIMER_H_
#define TIMER_H_

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace soltran
{

///---------------------------------------------------------------------
/// \class Timer
/// \brief A timer class similar to a stopwatch.
/// \details Each call to startTimer() is matched by a call to stopTimer().
///          Nested calls are matched in reverse order. Times stopped with
///          a split name accumulate in a table shared by all timers, so a
///          split can be reported far from where it was measured.
///---------------------------------------------------------------------
class Timer {

public:

  using Clock = std::chrono::steady_clock;

  void startTimer();

  /// \brief Stops the innermost running timer. Stopping an idle timer
  ///        does nothing.
  void stopTimer();

  /// \brief Stops the innermost running timer and adds the elapsed time
  ///        to a split.
  void stopTimer(const std::string &split);

  /// \brief Returns the time between the last start and stop in seconds.
  double getTime() const { return _elapsed; }

  /// \brief Returns the accumulated time of a split, 0 if it is unknown.
  static double getSplit(const std::string &split);

  /// \brief Prints a split at result level.
  /// \param split Name of the split.
  /// \param caption Text printed before the time.
  /// \param level Indentation level.
  /// \param parent_split A split to compute the percentage against.
  static void printSplit(const std::string &split, const std::string &caption,
                         int level = 0, const std::string &parent_split = "");

  static void clearSplits();

private:

  std::vector<Clock::time_point> _starts;  ///< Running (nested) timers
  double _elapsed = 0.;                    ///< Time of the last stop

  static std::map<std::string, double> &splits();

};

} // namespace soltran

#endif  // TIMER_H_
