#ifndef __TETHER_RECORD_STORE__
#define __TETHER_RECORD_STORE__

#include <sqlite3.h>

#include "Headers.hpp"
#include "ProjectKey.hpp"
#include "Record.hpp"

namespace tether {
/**
 * @brief Durable record tables (file comments and activity logs) in a
 * SQLite database.
 *
 * Every read is scoped by a ProjectKey, so records of one project never
 * show up in queries for another.  The connection is opened in serialized
 * mode and may be shared between threads.
 */
class RecordStore {
 public:
  /** @brief File name of the database inside the data directory. */
  static constexpr const char *DATABASE_FILENAME = "tether.db";

  /**
   * @brief Opens (creating if needed) the database at `path`.  Pass
   * `:memory:` for a private in-memory database.
   * @throws TetherException(PersistenceFailure)
   */
  explicit RecordStore(const string &path);
  virtual ~RecordStore();

  RecordStore(const RecordStore &) = delete;
  RecordStore &operator=(const RecordStore &) = delete;

  /**
   * @brief Appends a record and returns its row id.
   * @throws TetherException(PersistenceFailure) if the write fails, or
   * (InvalidAction) if the record carries a malformed project key.
   */
  virtual int64_t appendRecord(const PersistedRecord &record);

  /**
   * @brief Returns the records of one project in `table` whose path or
   * scope equals `scope`, oldest first.
   */
  virtual vector<PersistedRecord> queryRecords(const ProjectKey &key,
                                               RecordTable table,
                                               const string &scope);

 protected:
  void execute(const string &sql);
  vector<PersistedRecord> runQuery(const string &sql, RecordTable table,
                                   const vector<string> &params);
  void fail(const string &what);

  sqlite3 *db;
  string path;
};
}  // namespace tether

#endif  // __TETHER_RECORD_STORE__
