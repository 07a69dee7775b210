#include "soltran/RegionDataHandlerHDF5.h"

#include <utility>

namespace soltran
{


RegionDataHandlerHDF5::RegionDataHandlerHDF5(std::string file):
  HDF5Handler(std::move(file), HDF5Mode::Truncate)
{ }


void RegionDataHandlerHDF5::writeHeader(const RegionGrid &grid) {

  writeMetaData(grid);

  if (!existsH5Link(_file_id, "steps"))
    H5Gclose(createH5Group(_file_id, "steps"));

  log::verbose("Region history will be written to '{}'", _file);
}


void RegionDataHandlerHDF5::writeMetaData(const RegionGrid &grid) {

  writeScalarAttribute(_file_id, "# regions", static_cast<int>(grid.size()));
  writeScalarAttribute(_file_id, "# axial", grid.getNumAxial());
  writeScalarAttribute(_file_id, "# radial", grid.getNumRadial());
}


void RegionDataHandlerHDF5::record(const TransientState &state,
                                   const RegionGrid &grid) {

  auto path = fmt::format("steps/{}", state.tick);

  if (existsH5Link(_file_id, path))
    log::error("Step {} has already been recorded in '{}'", state.tick, _file);

  auto group_id = createH5Group(_file_id, path);

  writeScalarAttribute(group_id, "time", state.time);
  writeScalarAttribute(group_id, "k-eff", state.keff);
  writeScalarAttribute(group_id, "k-eff+2sigma", state.keff_max);
  writeScalarAttribute(group_id, "lifetime", state.lifetime);
  writeScalarAttribute(group_id, "nu-bar", state.nubar);
  writeScalarAttribute(group_id, "population", state.population);
  writeScalarAttribute(group_id, "cumulative fissions", state.cumulative_fissions);
  writeStringAttribute(group_id, "phase", state.phase._to_string());

  writeRegionArrays(group_id, state, grid);

  H5Gclose(group_id);
  H5Fflush(_file_id, H5F_SCOPE_GLOBAL);
}


void RegionDataHandlerHDF5::writeRegionArrays(hid_t group_id,
                                              const TransientState &state,
                                              const RegionGrid &grid) {

  std::vector<double> temperature, height, base_height, volume, mass;

  for (const auto &r : grid) {
    temperature.push_back(r.getTemperature());
    height.push_back(r.getHeight());
    base_height.push_back(r.getBaseHeight());
    volume.push_back(r.getVolume());
    mass.push_back(r.getMass());
  }

  writeVector(group_id, "temperature", temperature);
  writeVector(group_id, "height", height);
  writeVector(group_id, "base height", base_height);
  writeVector(group_id, "volume", volume);
  writeVector(group_id, "mass", mass);
  writeVector(group_id, "fissions", state.region_fissions);
}


StringVec RegionDataHandlerHDF5::getStepNames() {

  if (!existsH5Link(_file_id, "steps"))
    return {};

  auto group_id = openH5Group(_file_id, "steps");
  auto names = discoverNames(group_id);
  H5Gclose(group_id);

  return names;
}


} // namespace soltran
