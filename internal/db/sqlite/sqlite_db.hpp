#pragma once

#include <sqlite3.h>

#include <string>

namespace blobkeep::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Opened in serialized (FULLMUTEX) mode so one handle can be shared
  by every store caller and the expiry reaper.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::string synchronous = "NORMAL");
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  void Close();

 private:
  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(const std::string& synchronous);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace blobkeep::db::sqlite
