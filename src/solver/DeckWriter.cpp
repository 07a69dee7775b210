#include "soltran/DeckWriter.h"
#include "soltran/errors.h"
#include "soltran/log.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <utility>

namespace soltran
{


DeckWriter::DeckWriter(std::string library, int generations):
  _library(std::move(library)),
  _generations(generations)
{
  if (_library.empty())
    log::raise<ConfigurationError>("The cross-section library must not be empty");
  if (_generations < 1)
    log::raise<ConfigurationError>("The number of generations must be positive, "
                                   "got {}", _generations);
}


std::string DeckWriter::printDeckToString(const RegionGrid &grid,
                                          bool trace_volumes) const {

  if (grid.empty())
    log::error("Trying to write a deck without regions");

  std::string deck;
  deck += "'Input generated for SCALE 6.1 by soltran\n";
  deck += "'batch_args \\-m\n";
  deck += "=csas6\n";
  deck += "solutionmodel\n";
  deck += _library + "\n";

  printComposition(deck, grid);
  printCellData(deck, grid);
  printParameters(deck);
  printGeometry(deck, grid);

  if (trace_volumes) {
    deck += "read volume\n";
    deck += "  type=trace\n";
    deck += "end volume\n";
  }

  deck += "end data\n";
  deck += "end\n";

  return deck;
}


void DeckWriter::writeDeckToFile(const std::string &file, const RegionGrid &grid,
                                 bool trace_volumes) const {

  auto deck = printDeckToString(grid, trace_volumes);

  std::ofstream out(file, std::ios::trunc);
  if (!out)
    log::raise<ProcessFailure>("Failed to open deck '{}' for writing: {}",
                               file, std::strerror(errno));

  out << deck;
  out.close();

  if (out.fail())
    log::raise<ProcessFailure>("Failed to write deck '{}'", file);

  log::debug("Finished writing deck: {}", file);
}


/// \details One record per nuclide per region.
void DeckWriter::printComposition(std::string &deck, const RegionGrid &grid) const {

  deck += "read composition\n";
  for (const auto &r : grid) {
    for (const auto &nuc : r.compositionRecord()) {
      deck += fmt::format(" {}       {} 0 {} {}   end\n",
                          nuc.label, nuc.region_id, nuc.number_density,
                          nuc.temperature);
    }
  }
  deck += "end composition\n";
}


void DeckWriter::printCellData(std::string &deck, const RegionGrid &grid) const {

  deck += "read celldata\n";
  deck += "  multiregion cylindrical left_bdy=reflected right_bdy=vacuum end\n";
  deck += fmt::format("           1           {}  \n", grid.getTotalRadius());
  deck += "      end zone\n";
  deck += "end celldata\n";
}


void DeckWriter::printParameters(std::string &deck) const {

  deck += "read parameter\n";
  deck += fmt::format(" gen={}\n", _generations);
  deck += " htm=no\n";
  deck += " wrs=35\n";
  deck += "end parameter\n";
}


/// \details Every region is a cylinder of its outer radius. A region of
///          an outer column is carved out of the inner column by a
///          negative reference to its inner neighbour. The void cylinder
///          excludes the outer region of every row.
void DeckWriter::printGeometry(std::string &deck, const RegionGrid &grid) const {

  int num_regions = grid.size();
  int void_id = num_regions + 1;

  deck += "read geometry\n";
  deck += "global unit 1\n";
  deck += "com=\"global unit 1\"\n";

  for (const auto &r : grid) {
    auto g = r.geometryRecord();
    deck += fmt::format(" cylinder {}       {}       {}        {}\n",
                        g.id, g.radius, g.height, g.base_height);
  }

  deck += fmt::format(" cylinder {}       {}       {}       -1\n",
                      void_id, grid.getTotalRadius() + 1,
                      grid.getTotalHeight() + 1);

  for (int i = 0; i < grid.getNumAxial(); ++i) {
    for (int j = 0; j < grid.getNumRadial(); ++j) {
      int id = grid.at(i, j).getId();
      deck += fmt::format(" media {0} 1 {0}", id);
      if (j != 0)
        deck += fmt::format(" -{}", id - 1);
      deck += "\n";
    }
  }

  deck += fmt::format(" media 0 1 {}", void_id);
  for (int id = 1; id <= num_regions; ++id) {
    if (id % grid.getNumRadial() == 0)
      deck += fmt::format(" -{}", id);
  }
  deck += "\n";

  deck += fmt::format(" boundary {}\n", void_id);
  deck += "end geometry\n";
}


} // namespace soltran
