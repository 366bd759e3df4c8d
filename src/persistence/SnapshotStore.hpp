#ifndef __TETHER_SNAPSHOT_STORE__
#define __TETHER_SNAPSHOT_STORE__

#include "AppState.hpp"
#include "Headers.hpp"

namespace tether {
/**
 * @brief Keeps the latest state snapshot on disk for crash recovery.
 *
 * The snapshot is a protobuf RecoveryFile holding the state as json.  It
 * is written to a temp file and renamed into place, so a reader sees either
 * the old or the new snapshot.  In-memory state stays authoritative.
 */
class SnapshotStore {
 public:
  static constexpr const char *SNAPSHOT_FILENAME = "state.snapshot";

  /**
   * @param directory Data directory that holds the snapshot.
   * @param key Identifies the owner; a snapshot written under a different
   * key is ignored on load.
   */
  SnapshotStore(const string &directory, const string &key);
  virtual ~SnapshotStore() {}

  /**
   * @brief Writes the snapshot.
   * @throws TetherException(PersistenceFailure)
   */
  virtual void save(const AppState &state);

  /**
   * @brief Reads the snapshot.  A missing file is not an error; a corrupt
   * file, a different format version or a foreign key is logged and
   * treated as no snapshot.
   */
  virtual optional<AppState> load();

  const string &getPath() const { return path; }

 protected:
  string directory;
  string key;
  string path;
};
}  // namespace tether

#endif  // __TETHER_SNAPSHOT_STORE__
