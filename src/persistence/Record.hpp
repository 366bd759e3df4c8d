#ifndef __TETHER_RECORD__
#define __TETHER_RECORD__

#include "Headers.hpp"

namespace tether {
enum class RecordTable { FileComments, ActivityLogs };

/**
 * @brief A row in one of the record tables.
 *
 * `scope` is the file path for comments and a free-form scope (`project`,
 * `terminal`, `chat`, ...) for activity logs.  `author` only applies to
 * comments and `level` only to activity logs.
 */
struct PersistedRecord {
  int64_t id = 0;
  string project_key;
  RecordTable table = RecordTable::ActivityLogs;
  string scope;
  string content;
  string author;
  string level;
  int64_t created_at = 0;
};

inline bool operator==(const PersistedRecord &a, const PersistedRecord &b) {
  return a.id == b.id && a.project_key == b.project_key &&
         a.table == b.table && a.scope == b.scope && a.content == b.content &&
         a.author == b.author && a.level == b.level &&
         a.created_at == b.created_at;
}
}  // namespace tether

#endif  // __TETHER_RECORD__
