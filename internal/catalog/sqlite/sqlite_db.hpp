#pragma once

#include <sqlite3.h>

#include <string>

namespace snapshot::catalog::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Throws util::CatalogUnavailable on every failure so callers above the
  catalog never see sqlite error codes.
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

  // Execute a SQL string (used for pragmas and schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace snapshot::catalog::sqlite
