#include "soltran/file_utils.h"
#include "soltran/log.h"

#include <sys/stat.h>
#include <errno.h>
#include <cstring>

#ifdef MAX_PATH_LEN
#undef MAX_PATH_LEN
#endif
#define MAX_PATH_LEN 256

namespace soltran {

namespace fileutils {


bool existsFile(const std::string &path) {
  struct stat path_stat;
  return !stat(path.c_str(), &path_stat) && S_ISREG(path_stat.st_mode);
}


bool existsDirectory(const std::string &path) {
  struct stat path_stat;
  return !stat(path.c_str(), &path_stat) && S_ISDIR(path_stat.st_mode);
}


/// \details Every missing component of the path is created with mode 0700.
void createDirectory(const std::string &path) {

  if (path.empty() || existsDirectory(path))
    return;

  if (path.size() >= MAX_PATH_LEN) {
    log::error("Failed to create directory '{}': exceeded maximum length {}", path, MAX_PATH_LEN);
  }

  errno = 0;

  char _path[MAX_PATH_LEN];
  char *p;

  // Copy string to make it mutable
  std::strcpy(_path, path.c_str());

  for (p = _path + 1; *p; p++) {
    if (*p == '/') {
      // Temporarily truncate the string to get a directory path
      *p = '\0';

      if (mkdir(_path, S_IRWXU) != 0) {
        if (errno != EEXIST)
          log::error("Failed to create directory '{}': {}", path, std::strerror(errno));
      }

      *p = '/';
    }
  }

  if (mkdir(_path, S_IRWXU) != 0) {
    if (errno != EEXIST)
      log::error("Failed to create directory '{}': {}", path, std::strerror(errno));
  }
}


std::string getExtension(const std::string &file) {
  auto slash = file.rfind('/');
  auto pos = file.rfind('.');

  if (pos != std::string::npos &&
      (slash == std::string::npos || pos > slash)) {
    return file.substr(pos);
  }

  return "";
}


std::string replaceExtension(const std::string &file, const std::string &ext) {
  auto old_ext = getExtension(file);
  return file.substr(0, file.size() - old_ext.size()) + ext;
}


std::string joinPath(const std::string &dir, const std::string &file) {
  if (dir.empty() || dir == ".")
    return file;
  if (dir.back() == '/')
    return dir + file;
  return dir + "/" + file;
}


} // namespace fileutils

} // namespace soltran
