/// \file ReportParser.h
/// \brief Extraction of results from CSAS6 output reports.

#ifndef REPORT_PARSER_H_
#define REPORT_PARSER_H_

#include <string>
#include <vector>

#include "soltran/SolverResult.h"
#include "soltran/string_utils.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class ReportParser
/// \brief Reads k-eff, lifetime, nu-bar, fission densities, volumes and
///        masses from a report
/// \details Region and mixture ids are numbered from 1. The void region
///          (id N+1) and the void mixture (id 0) are skipped. Any required
///          field which is absent or malformed raises DataUnavailable.
///---------------------------------------------------------------------
class ReportParser {

public:

  /// \param num_regions Number of non-void regions.
  explicit ReportParser(int num_regions);

  int getNumRegions() const { return _num_regions; }

  /// \brief Parses a report file.
  /// \param file Path to the report.
  /// \param require_masses Whether mixture masses must be present.
  SolverResult parseFile(const std::string &file, bool require_masses) const;

  /// \brief Parses the lines of a report.
  SolverResult parseLines(const StringVec &lines, bool require_masses) const;

  /// \brief Returns the fission densities normalized to sum 1.
  std::vector<double> parseFissionProfile(const StringVec &lines) const;

  /// \brief Reads lifetime, k-eff with its deviation and nu-bar.
  void parseTransientData(const StringVec &lines, SolverResult &result) const;

  /// \brief Reads the standalone region volume table.
  /// \return Volumes in region id order, or an empty vector if the table
  ///         is absent.
  std::vector<double> parseRegionVolumes(const StringVec &lines) const;

  /// \brief Reads the combined mixture volume and mass table.
  /// \return False if the table is absent.
  bool parseMixtures(const StringVec &lines, std::vector<double> &volumes,
                     std::vector<double> &masses) const;

private:

  int _num_regions;

};

} // namespace soltran

#endif  // REPORT_PARSER_H_
