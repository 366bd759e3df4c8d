#ifndef __TETHER_DIRECTORY_READER__
#define __TETHER_DIRECTORY_READER__

#include "AppState.hpp"
#include "Headers.hpp"

namespace tether {
/**
 * @brief Produces directory listings for the explorer.
 */
class DirectoryReader {
 public:
  virtual ~DirectoryReader() {}

  /**
   * @brief Lists the immediate children of `path`.
   * @throws std::runtime_error if the directory cannot be read.
   */
  virtual vector<FileEntry> readDirectory(const string &path) = 0;
};

/**
 * @brief Reads listings from the local filesystem.  Directories come
 * first, then files, each sorted by name.
 */
class FsDirectoryReader : public DirectoryReader {
 public:
  virtual vector<FileEntry> readDirectory(const string &path);
};
}  // namespace tether

#endif  // __TETHER_DIRECTORY_READER__
