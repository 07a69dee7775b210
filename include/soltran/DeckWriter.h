/// \file DeckWriter.h
/// \brief Generation of CSAS6 input decks.

#ifndef DECK_WRITER_H_
#define DECK_WRITER_H_

#include <string>

#include "soltran/RegionGrid.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class DeckWriter
/// \brief Writes a region grid as a CSAS6 criticality input
/// \details A deck consists of the composition of every region, a
///          multiregion cell data block, the parameter block and a
///          geometry of stacked cylinders wrapped in a void cylinder
///          which carries the vacuum boundary.
///---------------------------------------------------------------------
class DeckWriter {

public:

  /// \param library Cross-section library, e.g. v7-238.
  /// \param generations Number of generations to be simulated.
  DeckWriter(std::string library, int generations);

  const std::string &getLibrary() const { return _library; }
  int getGenerations() const { return _generations; }

  /// \brief Prints a deck to a string.
  /// \param grid Regions to be written.
  /// \param trace_volumes Whether to ask for a volume calculation.
  std::string printDeckToString(const RegionGrid &grid, bool trace_volumes) const;

  /// \brief Writes a deck to a file, overwriting it.
  void writeDeckToFile(const std::string &file, const RegionGrid &grid,
                       bool trace_volumes) const;

private:

  void printComposition(std::string &deck, const RegionGrid &grid) const;
  void printCellData(std::string &deck, const RegionGrid &grid) const;
  void printParameters(std::string &deck) const;
  void printGeometry(std::string &deck, const RegionGrid &grid) const;

  std::string _library;
  int _generations;

};

} // namespace soltran

#endif  // DECK_WRITER_H_
