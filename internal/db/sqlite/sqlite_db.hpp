#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace fwbuild::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool synchronous_full = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, synchronous, busy timeout)
  void Configure(bool synchronous_full);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace fwbuild::db::sqlite
