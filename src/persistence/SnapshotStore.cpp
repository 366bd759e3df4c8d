#include "SnapshotStore.hpp"

#include "FdUtils.hpp"
#include "Tether.pb.h"
#include "TetherException.hpp"

namespace tether {
SnapshotStore::SnapshotStore(const string &_directory, const string &_key)
    : directory(_directory),
      key(_key),
      path((fs::path(_directory) / SNAPSHOT_FILENAME).string()) {}

void SnapshotStore::save(const AppState &state) {
  RecoveryFile file;
  file.set_format_version(RECOVERY_FORMAT_VERSION);
  file.set_key(key);
  file.set_saved_at_ms(nowMillis());
  file.set_state_json(dumpJson(json(state)));
  string bytes = protoToString(file);

  string tmpPattern = path + ".XXXXXX";
  int fd = mkstemp(&tmpPattern[0]);
  if (fd < 0) {
    throw TetherException(ErrorKind::PersistenceFailure,
                          "Cannot create " + tmpPattern + ": " +
                              strerror(GetErrno()));
  }
  try {
    FdUtils::writeAll(fd, bytes.data(), bytes.length());
  } catch (const std::runtime_error &ex) {
    ::close(fd);
    ::unlink(tmpPattern.c_str());
    throw TetherException(ErrorKind::PersistenceFailure,
                          string("Cannot write snapshot: ") + ex.what());
  }
  ::fsync(fd);
  ::close(fd);
  if (::rename(tmpPattern.c_str(), path.c_str()) == -1) {
    int renameErrno = GetErrno();
    ::unlink(tmpPattern.c_str());
    throw TetherException(ErrorKind::PersistenceFailure,
                          "Cannot replace " + path + ": " +
                              strerror(renameErrno));
  }
  VLOG(1) << "Saved snapshot version " << state.version << " to " << path;
}

optional<AppState> SnapshotStore::load() {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    LOG(INFO) << "No snapshot at " << path;
    return nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  RecoveryFile file;
  try {
    file = stringToProto<RecoveryFile>(buffer.str());
  } catch (const std::runtime_error &ex) {
    LOG(ERROR) << "Ignoring corrupt snapshot " << path << ": " << ex.what();
    return nullopt;
  }
  if (file.format_version() != RECOVERY_FORMAT_VERSION) {
    LOG(ERROR) << "Ignoring snapshot with format version "
               << file.format_version();
    return nullopt;
  }
  if (file.key() != key) {
    LOG(ERROR) << "Ignoring snapshot written for a different key";
    return nullopt;
  }
  try {
    return json::parse(file.state_json()).get<AppState>();
  } catch (const json::exception &ex) {
    LOG(ERROR) << "Ignoring snapshot with bad state: " << ex.what();
  } catch (const TetherException &ex) {
    LOG(ERROR) << "Ignoring snapshot with bad state: " << ex.what();
  }
  return nullopt;
}
}  // namespace tether
