#include "soltran/log.h"
#include "soltran/file_utils.h"
#include "soltran/string_utils.h"

#include <cstdio>
#include <ctime>
#include <fstream>

#include <fmt/chrono.h>

namespace soltran {


namespace log {


namespace {

constexpr size_t default_line_length = 74;
constexpr int prefix_width = 8;

/// State shared by the logging functions
struct LoggerState {
  level min_level = level::info;  ///< Messages below this level are dropped
  std::string path;               ///< Log file, empty for screen only
  bool file_started = false;      ///< Whether the timestamp has been written
  size_t line_length = default_line_length;
  char separator_char = '*';
  char title_char = '*';
};

LoggerState &state() {
  static LoggerState s;
  return s;
}


std::string make_prefix(const std::string &tag) {
  return fmt::format("[{: ^{}}]  ", tag, prefix_width);
}


/// \brief Splits a message at newlines and wraps each piece at word
///        boundaries. Continuation lines start with an ellipsis.
std::string wrap_lines(const std::string &prefix, const std::string &message) {

  const auto width = state().line_length;
  std::string out;
  bool first = true;

  for (auto &&piece : stringutils::splitString(message, "\n")) {
    std::string rest = piece;

    do {
      auto limit = first ? width : width - 4;
      std::string line;

      if (rest.size() <= limit) {
        line = rest;
        rest.clear();
      }
      else {
        auto cut = rest.find_last_of(' ', limit);
        if (cut == std::string::npos || cut == 0)
          cut = limit;
        line = rest.substr(0, cut);
        rest = stringutils::ltrim(rest.substr(cut));
      }

      out += prefix + (first ? "" : "... ") + line + "\n";
      first = false;
    } while (!rest.empty());
  }

  if (out.empty())
    out = prefix + "\n";

  return out;
}

} // anonymous namespace


//----------------------------------------------------------------------
// Configuration
//----------------------------------------------------------------------
/// \details The parent directory is created if it does not exist. A new
///          path restarts the timestamp header.
void set_path(const std::string &path) {

  auto pos = path.find_last_of('/');
  if (pos != std::string::npos)
    fileutils::createDirectory(path.substr(0, pos + 1));

  state().path = path;
  state().file_started = false;
}


std::string get_path() {
  return state().path;
}


void set_level(const std::string &new_level) {
  state().min_level = level::_from_string_nocase(new_level.c_str());
  log::verbose("Logging level set to {}", new_level);
}


void set_level(level new_level) {
  state().min_level = new_level;
}


level get_level() {
  return state().min_level;
}


void set_line_length(size_t length) {
  state().line_length = length;
}


size_t get_line_length() {
  return state().line_length;
}


size_t get_default_line_length() {
  return default_line_length;
}


//----------------------------------------------------------------------
// Printing
//----------------------------------------------------------------------
std::string create_log_string(level log_level, const std::string &message) {

  const auto &s = state();

  switch (log_level) {

    case level::separator :
      {
        auto c = message.empty() ? s.separator_char : message[0];
        return make_prefix("SP") + std::string(s.line_length, c) + "\n";
      }

    case level::header :
    case level::title :
      {
        auto prefix = make_prefix(stringutils::toUpper(std::string(log_level._to_string())));
        auto border = prefix + std::string(s.line_length, s.title_char);
        return fmt::format("{0}\n{1}{3: ^{2}}\n{0}\n",
                           border, prefix, s.line_length, message);
      }

    default :
      return wrap_lines(make_prefix(stringutils::toUpper(std::string(log_level._to_string()))),
                        message);
  }
}


void print_formatted_string(level log_level, const std::string &message) {

  if (log_level == +level::error) {
    auto msg = create_log_string(log_level, message);
    print_string_to_file(msg);
    throw std::logic_error(message);
  }

  if (log_level >= state().min_level) {
    auto msg = create_log_string(log_level, message);
    fmt::print("{}", msg);
    std::fflush(stdout);
    print_string_to_file(msg);
  }
}


/// \details The file is opened for each message. The first message after
///          set_path() is preceded by the local date and time.
void print_string_to_file(const std::string &msg) {

  auto &s = state();
  if (s.path.empty())
    return;

  std::ofstream f(s.path, std::ios::app);

  if (!s.file_started) {
    std::time_t rawtime = std::time(nullptr);
    f << fmt::format("Current local date and time: {:%F %T}\n", *std::localtime(&rawtime));
    s.file_started = true;
  }

  f << msg;
}


} // namespace log

} // namespace soltran
