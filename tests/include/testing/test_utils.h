#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "cxxopts.hpp"

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>


///---------------------------------------------------------------------
/// \class TestOptions
/// \brief Parses options in addition to googletest options.
///---------------------------------------------------------------------
class TestOptions {

public:

  static TestOptions &get() {
    static TestOptions instance;
    return instance;
  }

  TestOptions(const TestOptions&) = delete;
  TestOptions &operator=(const TestOptions&) = delete;

  /// \brief Parses the options left over by googletest.
  void parse(int argc, char **argv) {
    cxxopts::Options options {"soltran_tests", ""};
    options
      .allow_unrecognised_options()
      .add_options()
      ("keep-files", "Keep temporary files written by tests",
       cxxopts::value<bool>(_keep_files)->default_value("false"))
      ("log-level",  "Set the minimum log level for output.",
       cxxopts::value<std::string>(_log_level)->default_value("test"))
    ;
    options.parse(argc, argv);
  }

  bool keepFiles() const { return _keep_files; }
  const std::string &getLogLevel() const { return _log_level; }

private:

  TestOptions() = default;

  bool _keep_files = false;
  std::string _log_level = "test";

};


namespace testutils {

/// \brief Creates a unique directory under /tmp and returns its path.
inline std::string makeTemporaryDirectory(const std::string &prefix) {
  std::string path = "/tmp/" + prefix + "XXXXXX";
  std::vector<char> buffer(path.begin(), path.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr)
    return "";
  return std::string(buffer.data());
}


/// \brief Removes a directory created by makeTemporaryDirectory().
inline void removeTemporaryDirectory(const std::string &path) {
  if (path.empty() || path.find("/tmp/") != 0 || TestOptions::get().keepFiles())
    return;
  std::string cmd = "rm -rf '" + path + "'";
  if (std::system(cmd.c_str()) != 0)
    ADD_FAILURE() << "Failed to remove " << path;
}


/// \brief Writes a string to a file, overwriting it.
inline void writeTextFile(const std::string &path, const std::string &text) {
  std::ofstream out(path, std::ios::trunc);
  out << text;
}


/// \brief Reads the lines of a text file.
inline std::vector<std::string> readLines(const std::string &path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line))
    lines.push_back(line);
  return lines;
}

} // namespace testutils

#endif  // TEST_UTILS_H_
