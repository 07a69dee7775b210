/// \file HDF5Handler.h
/// \brief An I/O class for HDF5 files

#ifndef HDF5_HANDLER_H_
#define HDF5_HANDLER_H_

#include <string>
#include <vector>

#include "hdf5.h"

#include "soltran/errors.h"
#include "soltran/log.h"
#include "soltran/string_utils.h"


namespace soltran
{


/// \enum HDF5Mode
enum class HDF5Mode {
  Truncate,   ///< Create a file, truncating any existing one
  ReadOnly    ///< Open an existing file for reading
};


/// \struct H5Type
/// \brief Memory and file datatypes of scalar attributes
template <typename T> struct H5Type;

template <> struct H5Type<int> {
  static hid_t memory() { return H5T_NATIVE_INT; }
  static hid_t file()   { return H5T_STD_I32LE; }
};

template <> struct H5Type<long> {
  static hid_t memory() { return H5T_NATIVE_LONG; }
  static hid_t file()   { return H5T_STD_I64LE; }
};

template <> struct H5Type<double> {
  static hid_t memory() { return H5T_NATIVE_DOUBLE; }
  static hid_t file()   { return H5T_IEEE_F64LE; }
};


///---------------------------------------------------------------------
/// \class HDF5Handler
/// \brief Methods for writing and reading HDF5 files
/// \details The file is opened by the constructor and closed by the
///          destructor. Group, dataset and attribute ids returned to the
///          caller must be closed by the caller.
///---------------------------------------------------------------------
class HDF5Handler {

protected:

  std::string _file;  ///< Path to the file
  hid_t _file_id;     ///< HDF5 file id

public:

  /// \brief Opens or creates a file.
  /// \details Failures throw soltran::Error.
  HDF5Handler(std::string file, HDF5Mode mode = HDF5Mode::ReadOnly);

  HDF5Handler(const HDF5Handler&) = delete;
  HDF5Handler& operator=(const HDF5Handler&) = delete;
  virtual ~HDF5Handler();

  hid_t getFileId() { return _file_id; }
  const std::string &getFilePath() const { return _file; }

  /// \brief Lists the links of a group in name order.
  static StringVec discoverNames(hid_t group_id);

  //--------------------------------------
  // Groups
  //--------------------------------------
  /// \brief Creates a group. Throws if the group cannot be created.
  hid_t createH5Group(hid_t loc_id, const std::string &path);

  /// \brief Opens a group. Returns a negative id on failure.
  hid_t openH5Group(hid_t loc_id, const std::string &path);

  /// \brief Checks the existence of a link relative to loc_id.
  bool existsH5Link(hid_t loc_id, const std::string &path);

  //--------------------------------------
  // Attributes
  //--------------------------------------
  template <typename T>
  void writeScalarAttribute(hid_t obj_id, const std::string &name, T value);

  template <typename T>
  void readScalarAttribute(hid_t obj_id, const std::string &name, T &value);

  /// \brief Writes a string as a fixed-length null-terminated attribute.
  void writeStringAttribute(hid_t obj_id, const std::string &name,
                            const std::string &value);

  std::string readStringAttribute(hid_t obj_id, const std::string &name);

  //--------------------------------------
  // Datasets
  //--------------------------------------
  /// \brief Writes a 1-D dataset of doubles. Empty vectors are skipped.
  void writeVector(hid_t loc_id, const std::string &path,
                   const std::vector<double> &data);

  /// \brief Reads a 1-D dataset of doubles.
  std::vector<double> readVector(hid_t loc_id, const std::string &path);

private:

  /// \brief Opens an attribute or throws DataUnavailable.
  hid_t openAttribute(hid_t obj_id, const std::string &name);

};


template <typename T>
void HDF5Handler::writeScalarAttribute(hid_t obj_id,
                                       const std::string &name,
                                       T value) {

  auto space_id = H5Screate(H5S_SCALAR);
  auto attr_id = H5Acreate(obj_id, name.c_str(), H5Type<T>::file(), space_id,
                           H5P_DEFAULT, H5P_DEFAULT);
  H5Sclose(space_id);

  if (attr_id < 0)
    log::raise<Error>("Failed to create attribute '{}' in '{}'", name, _file);

  auto status = H5Awrite(attr_id, H5Type<T>::memory(), &value);
  H5Aclose(attr_id);

  if (status < 0)
    log::raise<Error>("Failed to write attribute '{}' in '{}'", name, _file);
}


template <typename T>
void HDF5Handler::readScalarAttribute(hid_t obj_id,
                                      const std::string &name,
                                      T &value) {

  auto attr_id = openAttribute(obj_id, name);
  auto status = H5Aread(attr_id, H5Type<T>::memory(), &value);
  H5Aclose(attr_id);

  if (status < 0)
    log::raise<DataUnavailable>("Failed to read attribute '{}' in '{}'", name, _file);
}


} // namespace soltran

#endif  // HDF5_HANDLER_H_
