/// \file include/file_utils.h
/// \brief Utilities for file manipulation (POSIX)

#ifndef FILE_UTILES_H_
#define FILE_UTILES_H_

#include <string>

namespace soltran {

namespace fileutils {


/// \brief Check the existence of a regular file
bool existsFile(const std::string &path);

/// \brief Check the existence of a directory
bool existsDirectory(const std::string &path);

/// \brief Create a directory recursively
/// \param path Path to the directory
void createDirectory(const std::string &path);

/// \brief Get file extension from file name.
/// \param file File name.
/// \return File extension if succeed, "" otherwise.
std::string getExtension(const std::string &file);

/// \brief Replace the extension of a file name.
/// \details A file name without extension gets the new extension appended.
/// \param file File name.
/// \param ext New extension, including the dot.
std::string replaceExtension(const std::string &file, const std::string &ext);

/// \brief Join a directory and a file name with exactly one '/'.
std::string joinPath(const std::string &dir, const std::string &file);


} // namespace fileutils

} // namespace soltran

#endif  // FILE_UTILES_H_
