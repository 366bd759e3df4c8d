#include "DirectoryReader.hpp"

#include "ExplorerReducer.hpp"

namespace tether {
vector<FileEntry> FsDirectoryReader::readDirectory(const string &path) {
  vector<FileEntry> entries;
  // Throws fs::filesystem_error, which is a runtime_error.
  for (const auto &dirEntry : fs::directory_iterator(path)) {
    FileEntry entry;
    entry.name = dirEntry.path().filename().string();
    entry.path = dirEntry.path().string();
    std::error_code ec;
    entry.is_dir = dirEntry.is_directory(ec);
    if (!entry.is_dir) {
      auto size = dirEntry.file_size(ec);
      entry.size = ec ? 0 : int64_t(size);
    }
    entries.push_back(std::move(entry));
  }
  VLOG(1) << "Read " << entries.size() << " entries from " << path;
  return ExplorerReducer::sortEntries(std::move(entries));
}
}  // namespace tether
