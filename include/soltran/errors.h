/// \file include/errors.h
/// \brief Exception types reported by soltran.
/// \details Every condition below is fatal for a run. Only ProcessFailure
///          may be retried, and only by the solver adapter.

#ifndef ERRORS_H_
#define ERRORS_H_

#include <stdexcept>
#include <string>

namespace soltran {


///---------------------------------------------------------------------
/// \class Error
/// \brief Base class of all soltran run-time errors.
///---------------------------------------------------------------------
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what) : std::runtime_error(what) { }
};


/// \class ConfigurationError
/// \brief Invalid case name, geometry or physics parameters.
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string &what) : Error(what) { }
};


/// \class ProcessFailure
/// \brief The external solver could not be started, timed out, was
///        cancelled or produced no report.
class ProcessFailure : public Error {
public:
  explicit ProcessFailure(const std::string &what) : Error(what) { }
};


/// \class DataUnavailable
/// \brief A report was read but required fields are missing or malformed.
class DataUnavailable : public Error {
public:
  explicit DataUnavailable(const std::string &what) : Error(what) { }
};


/// \class InvariantViolation
/// \brief A derived physical quantity became non-positive or undefined.
class InvariantViolation : public Error {
public:
  explicit InvariantViolation(const std::string &what) : Error(what) { }
};


} // namespace soltran

#endif  // ERRORS_H_
