#include "soltran/ReportParser.h"
#include "soltran/errors.h"
#include "soltran/file_utils.h"
#include "soltran/log.h"

#include <cmath>
#include <fstream>
#include <regex>

namespace soltran
{


namespace {

const std::regex fission_pattern(R"(\s+\d?\s+?(\d+)\s+(\S+)\s+\S+\s+(\S+))");
const std::regex lifetime_pattern(R"(\slifetime\s=\s+(\S+)\s)");
const std::regex keff_pattern(R"(k-eff\s+(\S+)\s\+\sor\s-\s(\S+))");
const std::regex nubar_pattern(R"(system\snu\sbar\s+(\S+)\s)");
const std::regex volume_pattern(R"(\s+\d?\s*\d?\s*\d+\s+(\d+)\s+(\S+))");
const std::regex mixture_pattern(R"(\s+(\d+)\s+(\S+)\s\+/-\s\S+\s+(\S+))");


/// \brief Matches a pattern at the beginning of a line.
bool matchLeading(const std::string &line, const std::regex &pattern,
                  std::smatch &m) {
  return std::regex_search(line, m, pattern, std::regex_constants::match_continuous);
}


double toDouble(const std::string &s, const char *field) {
  try {
    size_t pos = 0;
    double value = std::stod(s, &pos);
    if (pos != s.size() || !std::isfinite(value))
      log::raise<DataUnavailable>("Malformed {} in report: '{}'", field, s);
    return value;
  }
  catch (const std::logic_error &) {
    log::raise<DataUnavailable>("Malformed {} in report: '{}'", field, s);
  }
}


int toId(const std::string &s, const char *field) {
  try {
    return std::stoi(s);
  }
  catch (const std::logic_error &) {
    log::raise<DataUnavailable>("Malformed {} id in report: '{}'", field, s);
  }
}

} // anonymous namespace


ReportParser::ReportParser(int num_regions):
  _num_regions(num_regions)
{
  if (_num_regions < 1)
    log::raise<ConfigurationError>("Number of regions must be positive, got {}",
                                   _num_regions);
}


SolverResult ReportParser::parseFile(const std::string &file,
                                     bool require_masses) const {

  if (!fileutils::existsFile(file))
    log::raise<ProcessFailure>("Report '{}' does not exist", file);

  std::ifstream in(file);
  if (!in)
    log::raise<ProcessFailure>("Failed to open report '{}'", file);

  StringVec lines;
  std::string line;
  while (std::getline(in, line))
    lines.push_back(line);

  log::debug("Parsing report '{}' ({} lines)", file, lines.size());

  return parseLines(lines, require_masses);
}


SolverResult ReportParser::parseLines(const StringVec &lines,
                                      bool require_masses) const {

  SolverResult result;

  parseTransientData(lines, result);
  result.fission_profile = parseFissionProfile(lines);

  std::vector<double> mix_volumes, mix_masses;
  bool has_mixtures = parseMixtures(lines, mix_volumes, mix_masses);

  result.volumes = parseRegionVolumes(lines);
  if (result.volumes.empty()) {
    if (!has_mixtures)
      log::raise<DataUnavailable>("Neither region volumes nor mixture volumes "
                                  "found in report");
    result.volumes = mix_volumes;
  }

  for (int i = 0; i < _num_regions; ++i) {
    if (result.volumes[i] <= 0.)
      log::raise<DataUnavailable>("Volume of region {} is missing or "
                                  "non-positive in report", i + 1);
  }

  if (require_masses) {
    if (!has_mixtures)
      log::raise<DataUnavailable>("Mixture masses not found in report");
    for (int i = 0; i < _num_regions; ++i) {
      if (mix_masses[i] <= 0.)
        log::raise<DataUnavailable>("Mass of mixture {} is missing or "
                                    "non-positive in report", i + 1);
    }
    result.masses = mix_masses;
  }

  return result;
}


/// \details The fission density table starts after the line of
///          '**** fission densities ****' and ends at the first line
///          containing 'frequency'.
std::vector<double> ReportParser::parseFissionProfile(const StringVec &lines) const {

  std::vector<double> profile(_num_regions, 0.);
  double sum = 0.;
  bool found = false, in_table = false;

  for (const auto &line : lines) {
    if (!in_table) {
      if (line.find("**** fission densities ****") != std::string::npos) {
        in_table = true;
        found = true;
      }
      continue;
    }

    if (line.find("frequency") != std::string::npos)
      in_table = false;

    std::smatch m;
    if (matchLeading(line, fission_pattern, m)) {
      int id = toId(m[1], "fission density");
      if (id == _num_regions + 1)
        continue;
      if (id < 1 || id > _num_regions)
        log::raise<DataUnavailable>("Unexpected region {} in fission densities", id);

      double value = toDouble(m[3], "fission density");
      profile[id - 1] = value;
      sum += value;
    }
  }

  if (!found)
    log::raise<DataUnavailable>("Fission densities not found in report");
  if (!(sum > 0.))
    log::raise<DataUnavailable>("Fission densities in report sum to {}", sum);

  for (auto &p : profile)
    p /= sum;

  return profile;
}


/// \details The last occurrence of each quantity wins.
void ReportParser::parseTransientData(const StringVec &lines,
                                      SolverResult &result) const {

  bool has_lifetime = false, has_keff = false, has_nubar = false;

  for (const auto &line : lines) {
    std::smatch m;

    if (line.find("lifetime") != std::string::npos &&
        std::regex_search(line, m, lifetime_pattern)) {
      result.lifetime = toDouble(m[1], "lifetime");
      has_lifetime = true;
    }

    if (line.find("best estimate system k-eff") != std::string::npos) {
      if (!std::regex_search(line, m, keff_pattern))
        log::raise<DataUnavailable>("Malformed k-eff line in report: '{}'", line);
      result.keff = toDouble(m[1], "k-eff");
      result.keff_sigma = toDouble(m[2], "k-eff deviation");
      result.keff_max = std::round((result.keff + 2 * result.keff_sigma) * 1.E5) / 1.E5;
      has_keff = true;
    }

    if (line.find("system nu bar") != std::string::npos &&
        std::regex_search(line, m, nubar_pattern)) {
      result.nubar = toDouble(m[1], "nu-bar");
      has_nubar = true;
    }
  }

  if (!has_lifetime)
    log::raise<DataUnavailable>("Neutron lifetime not found in report");
  if (!has_keff)
    log::raise<DataUnavailable>("Best estimate k-eff not found in report");
  if (!has_nubar)
    log::raise<DataUnavailable>("System nu-bar not found in report");
}


/// \details The table starts after 'total region volume' and ends at
///          'total mixture volume'. Region 0 and the void region are
///          skipped.
std::vector<double> ReportParser::parseRegionVolumes(const StringVec &lines) const {

  std::vector<double> volumes(_num_regions, 0.);
  bool found = false, in_table = false;

  for (const auto &line : lines) {
    if (!in_table) {
      if (line.find("total region volume") != std::string::npos) {
        in_table = true;
        found = true;
      }
      continue;
    }

    if (line.find("total mixture volume") != std::string::npos)
      in_table = false;

    std::smatch m;
    if (matchLeading(line, volume_pattern, m)) {
      int id = toId(m[1], "region volume");
      if (id < 1 || id > _num_regions)
        continue;
      volumes[id - 1] = toDouble(m[2], "region volume");
    }
  }

  if (!found)
    volumes.clear();

  return volumes;
}


/// \details The table starts after a line containing both 'total mixture
///          volume' and 'total mixture mass', and ends at 'biasing
///          information'.
bool ReportParser::parseMixtures(const StringVec &lines,
                                 std::vector<double> &volumes,
                                 std::vector<double> &masses) const {

  volumes.assign(_num_regions, 0.);
  masses.assign(_num_regions, 0.);
  bool found = false, in_table = false;

  for (const auto &line : lines) {
    if (!in_table) {
      if (line.find("total mixture volume") != std::string::npos &&
          line.find("total mixture mass") != std::string::npos) {
        in_table = true;
        found = true;
      }
      continue;
    }

    if (line.find("biasing information") != std::string::npos)
      in_table = false;

    std::smatch m;
    if (matchLeading(line, mixture_pattern, m)) {
      int id = toId(m[1], "mixture");
      if (id < 1 || id > _num_regions)
        continue;
      volumes[id - 1] = toDouble(m[2], "mixture volume");
      masses[id - 1] = toDouble(m[3], "mixture mass");
    }
  }

  return found;
}


} // namespace soltran
