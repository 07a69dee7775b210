/// \file log.h
/// \brief A custom logger with fmt as the backend.
/// \details Messages are printed to stdout and, once a path is set, appended
///          to a log file. Every line carries a bracketed level prefix.

#ifndef LOG_H_
#define LOG_H_

#include <stdexcept>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

#include "soltran/enum_types.h"


namespace soltran {

/// \namespace soltran::log
namespace log {


/// \enum level
/// \brief Ordered message types. Messages below the current level are
///        dropped, except errors.
BETTER_ENUM(level, char,
  debug,      ///< Debugging details
  profile,    ///< Timing reports
  verbose,    ///< Informational but verbose messages
  info,       ///< Progress of the run
  separator,  ///< A single line of characters
  header,     ///< A message centered between two lines of characters
  title,      ///< Same as header, used for the banners of a run
  warn,       ///< Recoverable conditions
  critical,   ///< Conditions which are about to stop the run
  result,     ///< Results of the run
  test,       ///< Messages from unit tests
  error       ///< Fatal conditions
)


/// \brief Formats a message with its level prefix. Long or multiline
///        messages are wrapped to the line length.
std::string create_log_string(level log_level, const std::string &msg);

/// \brief Prints a message of the given level to the screen and the log file.
/// \details A message of level error is written to the file and then
///          thrown as std::logic_error.
void print_formatted_string(level log_level, const std::string &msg);

/// \brief Appends a formatted message to the log file, if any.
void print_string_to_file(const std::string &msg);


//----------------------------------------------------------------------
// Logging interfaces
//----------------------------------------------------------------------
template <typename... Args>
void debug(const char* format, const Args & ... args) {
  print_formatted_string(level::debug, fmt::format(format, args...));
}

template <typename... Args>
void profile(const char* format, const Args & ... args) {
  print_formatted_string(level::profile, fmt::format(format, args...));
}

template <typename... Args>
void verbose(const char* format, const Args & ... args) {
  print_formatted_string(level::verbose, fmt::format(format, args...));
}

template <typename... Args>
void info(const char* format, const Args & ... args) {
  print_formatted_string(level::info, fmt::format(format, args...));
}

template <typename... Args>
void warn(const char* format, const Args & ... args) {
  print_formatted_string(level::warn, fmt::format(format, args...));
}

template <typename... Args>
void critical(const char* format, const Args & ... args) {
  print_formatted_string(level::critical, fmt::format(format, args...));
}

template <typename... Args>
void result(const char* format, const Args & ... args) {
  print_formatted_string(level::result, fmt::format(format, args...));
}

template <typename... Args>
void test(const char* format, const Args & ... args) {
  print_formatted_string(level::test, fmt::format(format, args...));
}

/// \brief Prints a line of characters. The first character of the
///        message, if any, replaces the default one.
template <typename... Args>
void separator(const char* format, const Args & ... args) {
  print_formatted_string(level::separator, fmt::format(format, args...));
}

template <typename... Args>
void header(const char* format, const Args & ... args) {
  print_formatted_string(level::header, fmt::format(format, args...));
}

template <typename... Args>
void title(const char* format, const Args & ... args) {
  print_formatted_string(level::title, fmt::format(format, args...));
}


/// \brief Logs an error message to the log file and throws an exception.
/// \details E is one of the exception types in errors.h. The exception
///          carries the message without the level prefix.
template <typename E, typename... Args>
[[noreturn]] void raise(const char* format, const Args & ... args) {
  auto msg = fmt::format(format, args...);
  print_string_to_file(create_log_string(level::error, msg));
  throw E(msg);
}


/// \brief Logs an internal error and throws std::logic_error.
template <typename... Args>
[[noreturn]] void error(const char* format, const Args & ... args) {
  raise<std::logic_error>(format, args...);
}


//----------------------------------------------------------------------
// Logger configuration
//----------------------------------------------------------------------
/// \brief Sets the log file. Missing directories are created.
void set_path(const std::string &path);
std::string get_path();

void set_level(const std::string &new_level);
void set_level(level new_level);
level get_level();

/// \brief Sets the maximum line length for log messages.
void set_line_length(size_t length);
size_t get_line_length();
size_t get_default_line_length();


} // namespace log

} // namespace soltran

#endif /* LOG_H_ */
