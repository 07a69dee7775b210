#include "soltran/Timer.h"
#include "soltran/log.h"

namespace soltran
{


std::map<std::string, double> &Timer::splits() {
  static std::map<std::string, double> table;
  return table;
}


void Timer::startTimer() {
  _starts.push_back(Clock::now());
}


void Timer::stopTimer() {
  if (_starts.empty())
    return;

  std::chrono::duration<double> d = Clock::now() - _starts.back();
  _elapsed = d.count();
  _starts.pop_back();
}


void Timer::stopTimer(const std::string &split) {
  stopTimer();
  splits()[split] += _elapsed;
}


double Timer::getSplit(const std::string &split) {
  auto it = splits().find(split);
  return it == splits().end() ? 0. : it->second;
}


/// \details Captions are padded with dots to a common column. Nested
///          levels are indented by two spaces per level.
void Timer::printSplit(const std::string &split, const std::string &caption,
                       int level, const std::string &parent_split) {

  const int indent = 2 * level;
  const int width = 51 - indent;
  const double time = getSplit(split);
  const double parent = getSplit(parent_split);

  if (parent > 0.)
    log::result("{0:{1}}{2:.<{3}} {4:1.5E} s {5:5.2f}%",
                "", indent, caption, width, time, time / parent * 100.);
  else
    log::result("{0:{1}}{2:.<{3}} {4:1.5E} s",
                "", indent, caption, width, time);
}


void Timer::clearSplits() {
  splits().clear();
}

} // namespace soltran
