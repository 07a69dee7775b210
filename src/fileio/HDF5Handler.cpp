#include "soltran/HDF5Handler.h"
#include "soltran/file_utils.h"

#include <utility>

namespace soltran
{


HDF5Handler::HDF5Handler(std::string file, HDF5Mode mode)
  : _file(std::move(file)) {

  if (mode == HDF5Mode::Truncate) {
    log::verbose("Creating H5 file '{}'", _file);
    _file_id = H5Fcreate(_file.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (_file_id < 0)
      log::raise<Error>("Failed to create HDF5 file: '{}'", _file);
  }
  else {
    if (!fileutils::existsFile(_file))
      log::raise<Error>("Cannot find HDF5 file: '{}'", _file);

    _file_id = H5Fopen(_file.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (_file_id < 0)
      log::raise<Error>("Failed to open HDF5 file: '{}'", _file);
  }

  log::debug("HDF5Handler accepts file: {}", _file);
}


HDF5Handler::~HDF5Handler() {
  H5Fclose(_file_id);
}


StringVec HDF5Handler::discoverNames(hid_t group_id) {

  StringVec names;

  auto collect =
    [](hid_t, const char *name, const H5L_info_t *, void *context) -> herr_t
      {
        static_cast<StringVec *>(context)->push_back(name);
        return 0;
      };

  H5Literate(group_id, H5_INDEX_NAME, H5_ITER_INC, nullptr, collect, &names);

  return names;
}


//--------------------------------------
// Groups
//--------------------------------------
hid_t HDF5Handler::createH5Group(hid_t loc_id, const std::string &path) {
  auto group_id = H5Gcreate(loc_id, path.c_str(),
                            H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  if (group_id < 0)
    log::raise<Error>("Failed to create group '{}' in '{}'", path, _file);
  return group_id;
}


hid_t HDF5Handler::openH5Group(hid_t loc_id, const std::string &path) {
  return H5Gopen(loc_id, path.c_str(), H5P_DEFAULT);
}


/// \details Intermediate links of the path must exist.
bool HDF5Handler::existsH5Link(hid_t loc_id, const std::string &path) {
  return H5Lexists(loc_id, path.c_str(), H5P_DEFAULT) > 0;
}


//--------------------------------------
// Attributes
//--------------------------------------
hid_t HDF5Handler::openAttribute(hid_t obj_id, const std::string &name) {
  if (H5Aexists(obj_id, name.c_str()) <= 0)
    log::raise<DataUnavailable>("Cannot find attribute '{}' in '{}'", name, _file);

  auto attr_id = H5Aopen(obj_id, name.c_str(), H5P_DEFAULT);
  if (attr_id < 0)
    log::raise<DataUnavailable>("Failed to open attribute '{}' in '{}'", name, _file);
  return attr_id;
}


void HDF5Handler::writeStringAttribute(hid_t obj_id, const std::string &name,
                                       const std::string &value) {

  auto type_id = H5Tcopy(H5T_C_S1);
  H5Tset_size(type_id, value.size() + 1);
  H5Tset_strpad(type_id, H5T_STR_NULLTERM);

  auto space_id = H5Screate(H5S_SCALAR);
  auto attr_id = H5Acreate(obj_id, name.c_str(), type_id, space_id,
                           H5P_DEFAULT, H5P_DEFAULT);

  herr_t status = -1;
  if (attr_id >= 0) {
    status = H5Awrite(attr_id, type_id, value.c_str());
    H5Aclose(attr_id);
  }

  H5Sclose(space_id);
  H5Tclose(type_id);

  if (status < 0)
    log::raise<Error>("Failed to write attribute '{}' in '{}'", name, _file);
}


std::string HDF5Handler::readStringAttribute(hid_t obj_id, const std::string &name) {

  auto attr_id = openAttribute(obj_id, name);

  auto type_id = H5Aget_type(attr_id);
  std::vector<char> buffer(H5Tget_size(type_id) + 1, '\0');
  auto status = H5Aread(attr_id, type_id, buffer.data());

  H5Tclose(type_id);
  H5Aclose(attr_id);

  if (status < 0)
    log::raise<DataUnavailable>("Failed to read attribute '{}' in '{}'", name, _file);

  return std::string(buffer.data());
}


//--------------------------------------
// Datasets
//--------------------------------------
void HDF5Handler::writeVector(hid_t loc_id, const std::string &path,
                              const std::vector<double> &data) {

  hsize_t count = data.size();
  if (count < 1) {
    log::verbose("Nothing to write for dataset '{}'", path);
    return;
  }

  auto space_id = H5Screate_simple(1, &count, nullptr);
  auto dataset_id = H5Dcreate(loc_id, path.c_str(), H5Type<double>::file(), space_id,
                              H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
  H5Sclose(space_id);

  if (dataset_id < 0)
    log::raise<Error>("Failed to create dataset '{}' in '{}'", path, _file);

  auto status = H5Dwrite(dataset_id, H5Type<double>::memory(),
                         H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data());
  H5Dclose(dataset_id);

  if (status < 0)
    log::raise<Error>("Failed to write dataset '{}' in '{}'", path, _file);

  log::debug("Writing {} values of dataset '{}'", count, path);
}


std::vector<double> HDF5Handler::readVector(hid_t loc_id, const std::string &path) {

  if (!existsH5Link(loc_id, path))
    log::raise<DataUnavailable>("Cannot find dataset '{}' in '{}'", path, _file);

  auto dataset_id = H5Dopen(loc_id, path.c_str(), H5P_DEFAULT);
  if (dataset_id < 0)
    log::raise<DataUnavailable>("Failed to open dataset '{}' in '{}'", path, _file);

  auto space_id = H5Dget_space(dataset_id);
  hsize_t dims[H5S_MAX_RANK];
  const int ndims = H5Sget_simple_extent_dims(space_id, dims, nullptr);
  H5Sclose(space_id);

  if (ndims != 1) {
    H5Dclose(dataset_id);
    log::raise<DataUnavailable>("Dataset '{}' in '{}' has {} dimensions but 1 is required",
                                path, _file, ndims);
  }

  std::vector<double> data(dims[0]);
  auto status = H5Dread(dataset_id, H5Type<double>::memory(),
                        H5S_ALL, H5S_ALL, H5P_DEFAULT, data.data());
  H5Dclose(dataset_id);

  if (status < 0)
    log::raise<DataUnavailable>("Failed to read dataset '{}' in '{}'", path, _file);

  return data;
}


} // namespace soltran
