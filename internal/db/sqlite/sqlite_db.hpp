#pragma once

#include <sqlite3.h>

#include <string>

namespace depgraph::db::sqlite {

// Owns one sqlite3 connection to the publication log file.
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements that return no rows. Throws on error.
  void Exec(const std::string& sql);

  // Creates the log tables if missing and stamps the schema version.
  // Throws InvalidState for a file written by a newer schema.
  void Bootstrap();

 private:
  int  UserVersion();
  void Configure(bool wal_mode);

  std::string path_;
  sqlite3*    db_ = nullptr;
};

} // namespace depgraph::db::sqlite
