/// \file ResultsRecorder.h
/// \brief Sinks for the records of a transient.

#ifndef RESULTS_RECORDER_H_
#define RESULTS_RECORDER_H_

#include <memory>
#include <string>

#include "soltran/RegionGrid.h"
#include "soltran/TransientState.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class ResultsRecorder
/// \brief A sink receiving one record per tick
///---------------------------------------------------------------------
class ResultsRecorder {

public:

  virtual ~ResultsRecorder() = default;

  /// \brief Starts a new sequence of records, discarding older ones.
  virtual void writeHeader(const RegionGrid &grid) = 0;

  /// \brief Appends the record of a tick.
  virtual void record(const TransientState &state, const RegionGrid &grid) = 0;

};

using ResultsRecorderPtr = std::shared_ptr<ResultsRecorder>;


///---------------------------------------------------------------------
/// \class ResultsFile
/// \brief Comma-separated results in a text file
/// \details Each record reads: time, cumulative fissions, maximum
///          temperature, neutron lifetime, k-eff and k-eff + 2 sigma.
///          The file is opened for every record so that it is complete
///          whenever the run stops.
///---------------------------------------------------------------------
class ResultsFile : public ResultsRecorder {

public:

  /// \param file Path to the results file.
  /// \param time_decimals Number of decimals of recorded times.
  ResultsFile(std::string file, int time_decimals);

  const std::string &getFilePath() const { return _file; }

  void writeHeader(const RegionGrid &grid) override;
  void record(const TransientState &state, const RegionGrid &grid) override;

  /// \brief Formats a record as a line without the line break.
  std::string formatRecord(const TransientState &state) const;

  static const std::string header;

private:

  void writeLine(const std::string &line, bool truncate);

  std::string _file;
  int _time_decimals;

};

} // namespace soltran

#endif  // RESULTS_RECORDER_H_
