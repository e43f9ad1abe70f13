#include "sqlite_db.hpp"

namespace dispatch::db::sqlite {

namespace {

// Other processes keep reading while one writes; a competing writer waits
// up to the busy timeout before the commit reports SQLITE_BUSY.
constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kPragmas[] = {
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
    "PRAGMA foreign_keys=ON;",
    "PRAGMA temp_store=MEMORY;",
};

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw SqliteError(rc, "open " + path_ + ": " + msg);
  }

  // UNIQUE and PRIMARY KEY violations come back as distinct extended codes.
  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, kBusyTimeoutMs);

  try {
    for (const char* pragma : kPragmas) {
      Exec(pragma);
    }
  } catch (const SqliteError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }

  std::string msg = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw SqliteError(rc & 0xff, msg);
}

} // namespace dispatch::db::sqlite
