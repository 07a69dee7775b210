/// \file RegionDataHandlerHDF5.h
/// \brief History of region data in HDF5 format

#ifndef REGION_DATA_HANDLER_HDF5_H_
#define REGION_DATA_HANDLER_HDF5_H_

#include <string>

#include "soltran/HDF5Handler.h"
#include "soltran/ResultsRecorder.h"

namespace soltran
{

///---------------------------------------------------------------------
/// \class RegionDataHandlerHDF5
/// \brief Writes the state of every region at every tick
/// \details The file has the following layout:
///            /                  # regions, # axial, # radial
///            /steps/<tick>      time, k-eff, k-eff+2sigma, lifetime,
///                               nu-bar, population, cumulative
///                               fissions, phase
///            /steps/<tick>/temperature, height, base height, volume,
///                          mass, fissions
///---------------------------------------------------------------------
class RegionDataHandlerHDF5 : public HDF5Handler, public ResultsRecorder {

public:

  /// \brief Creates the file, truncating it if it exists.
  explicit RegionDataHandlerHDF5(std::string file);

  void writeHeader(const RegionGrid &grid) override;
  void record(const TransientState &state, const RegionGrid &grid) override;

  /// \brief Returns the names of the recorded steps.
  StringVec getStepNames();

private:

  void writeMetaData(const RegionGrid &grid);
  void writeRegionArrays(hid_t group_id, const TransientState &state,
                         const RegionGrid &grid);

};

} // namespace soltran

#endif  // REGION_DATA_HANDLER_HDF5_H_
