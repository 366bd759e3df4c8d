#include "RecordStore.hpp"

#include "TetherException.hpp"

namespace tether {
namespace {
const char *SCHEMA =
    "CREATE TABLE IF NOT EXISTS file_comments ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  project_key TEXT NOT NULL,"
    "  path TEXT NOT NULL,"
    "  content TEXT NOT NULL,"
    "  author TEXT NOT NULL,"
    "  created_at INTEGER NOT NULL);"
    "CREATE INDEX IF NOT EXISTS idx_file_comments_key_path"
    "  ON file_comments(project_key, path);"
    "CREATE TABLE IF NOT EXISTS activity_logs ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  project_key TEXT NOT NULL,"
    "  scope TEXT NOT NULL,"
    "  level TEXT NOT NULL,"
    "  content TEXT NOT NULL,"
    "  created_at INTEGER NOT NULL);"
    "CREATE INDEX IF NOT EXISTS idx_activity_logs_key_scope"
    "  ON activity_logs(project_key, scope);";

const char *tableName(RecordTable table) {
  return table == RecordTable::FileComments ? "file_comments"
                                            : "activity_logs";
}

const char *scopeColumn(RecordTable table) {
  return table == RecordTable::FileComments ? "path" : "scope";
}

const char *tagColumn(RecordTable table) {
  return table == RecordTable::FileComments ? "author" : "level";
}

// Owns a prepared statement for the lifetime of one call.
class Statement {
 public:
  Statement(sqlite3 *db, const string &sql) : stmt(NULL) {
    rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, NULL);
  }
  ~Statement() { sqlite3_finalize(stmt); }

  bool ok() const { return rc == SQLITE_OK; }
  sqlite3_stmt *get() { return stmt; }

  void bindText(int index, const string &value) {
    sqlite3_bind_text(stmt, index, value.c_str(), int(value.length()),
                      SQLITE_TRANSIENT);
  }

 private:
  sqlite3_stmt *stmt;
  int rc;
};

string columnText(sqlite3_stmt *stmt, int column) {
  const unsigned char *text = sqlite3_column_text(stmt, column);
  if (text == NULL) {
    return string();
  }
  return string((const char *)text, sqlite3_column_bytes(stmt, column));
}
}  // namespace

RecordStore::RecordStore(const string &_path) : db(NULL), path(_path) {
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
              SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db, flags, NULL) != SQLITE_OK) {
    string message = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    db = NULL;
    throw TetherException(ErrorKind::PersistenceFailure,
                          "Cannot open " + path + ": " + message);
  }
  sqlite3_busy_timeout(db, 5000);
  try {
    if (path != ":memory:") {
      execute("PRAGMA journal_mode=WAL;");
    }
    execute(SCHEMA);
  } catch (const TetherException &) {
    sqlite3_close(db);
    db = NULL;
    throw;
  }
  LOG(INFO) << "Opened record store " << path;
}

RecordStore::~RecordStore() {
  if (db) {
    sqlite3_close(db);
  }
}

void RecordStore::fail(const string &what) {
  string message = what + ": " + sqlite3_errmsg(db);
  STERROR << message;
  throw TetherException(ErrorKind::PersistenceFailure, message);
}

void RecordStore::execute(const string &sql) {
  char *errorMessage = NULL;
  if (sqlite3_exec(db, sql.c_str(), NULL, NULL, &errorMessage) !=
      SQLITE_OK) {
    string message = errorMessage ? errorMessage : "unknown error";
    sqlite3_free(errorMessage);
    throw TetherException(ErrorKind::PersistenceFailure,
                          "Cannot execute sql: " + message);
  }
}

int64_t RecordStore::appendRecord(const PersistedRecord &record) {
  // Rejects keys that did not come from ProjectKey.
  ProjectKey key = ProjectKey::fromHex(record.project_key);

  const RecordTable table = record.table;
  string sql = string("INSERT INTO ") + tableName(table) +
               " (project_key, " + scopeColumn(table) + ", " +
               tagColumn(table) +
               ", content, created_at) VALUES (?, ?, ?, ?, ?);";
  Statement stmt(db, sql);
  if (!stmt.ok()) {
    fail("Cannot prepare insert");
  }
  stmt.bindText(1, key.hex());
  stmt.bindText(2, record.scope);
  stmt.bindText(3, table == RecordTable::FileComments ? record.author
                                                      : record.level);
  stmt.bindText(4, record.content);
  sqlite3_bind_int64(stmt.get(), 5, record.created_at);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    fail(string("Cannot insert into ") + tableName(table));
  }
  int64_t id = sqlite3_last_insert_rowid(db);
  VLOG(1) << "Appended " << tableName(table) << " row " << id;
  return id;
}

vector<PersistedRecord> RecordStore::queryRecords(const ProjectKey &key,
                                                  RecordTable table,
                                                  const string &scope) {
  string sql = string("SELECT id, project_key, ") + scopeColumn(table) +
               ", " + tagColumn(table) + ", content, created_at FROM " +
               tableName(table) + " WHERE project_key = ? AND " +
               scopeColumn(table) + " = ? ORDER BY created_at, id;";
  return runQuery(sql, table, {key.hex(), scope});
}

vector<PersistedRecord> RecordStore::runQuery(const string &sql,
                                              RecordTable table,
                                              const vector<string> &params) {
  Statement stmt(db, sql);
  if (!stmt.ok()) {
    fail("Cannot prepare query");
  }
  for (size_t a = 0; a < params.size(); a++) {
    stmt.bindText(int(a + 1), params[a]);
  }

  vector<PersistedRecord> records;
  while (true) {
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      fail(string("Cannot read ") + tableName(table));
    }
    PersistedRecord record;
    record.table = table;
    record.id = sqlite3_column_int64(stmt.get(), 0);
    record.project_key = columnText(stmt.get(), 1);
    record.scope = columnText(stmt.get(), 2);
    if (table == RecordTable::FileComments) {
      record.author = columnText(stmt.get(), 3);
    } else {
      record.level = columnText(stmt.get(), 3);
    }
    record.content = columnText(stmt.get(), 4);
    record.created_at = sqlite3_column_int64(stmt.get(), 5);
    records.push_back(std::move(record));
  }
  return records;
}
}  // namespace tether
