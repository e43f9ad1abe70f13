#pragma once

#include <sqlite3.h>

#include <mutex>
#include <stdexcept>
#include <string>

namespace dispatch::db::sqlite {

// A failed sqlite call. code() is the primary result code (SQLITE_BUSY, ...).
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  int code() const noexcept {
    return code_;
  }

 private:
  int code_;
};

/*
  One open database file.

  Several dispatchd processes may point at the same file; cross-process
  writers are serialized by sqlite's own lock (BEGIN IMMEDIATE plus the busy
  timeout). Within the process TxMutex() allows one transaction at a time.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Runs one or more statements without results. Throws SqliteError.
  void Exec(const std::string& sql);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace dispatch::db::sqlite
