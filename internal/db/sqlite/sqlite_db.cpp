#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/db/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace depgraph::db::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite: cannot open " + path_ + ": " + reason);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
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

  const std::string reason = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw std::runtime_error("sqlite " + path_ + ": " + reason);
}

int SqliteDB::UserVersion() {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error("sqlite " + path_ + ": " + sqlite3_errmsg(db_));
  }
  const int version = sqlite3_step(st) == SQLITE_ROW ? sqlite3_column_int(st, 0) : 0;
  sqlite3_finalize(st);
  return version;
}

void SqliteDB::Bootstrap() {
  const int found = UserVersion();
  if (found > schema::kSchemaVersion) {
    throw util::InvalidState("sqlite " + path_ + ": schema version " + std::to_string(found) + " is newer than supported version " +
                             std::to_string(schema::kSchemaVersion));
  }

  Exec(schema::kCreatePublications);
  Exec(schema::kCreateReferences);
  Exec(schema::kProbePublications);
  Exec(schema::kProbeReferences);

  if (found != schema::kSchemaVersion) {
    Exec("PRAGMA user_version=" + std::to_string(schema::kSchemaVersion) + ";");
    DEPGRAPH_LOG_INFO("publication log schema initialized",
                      {observability::StringField("path", path_), observability::IntField("schema_version", schema::kSchemaVersion)});
  }
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    // readers never block the publisher
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  } else {
    Exec("PRAGMA synchronous=FULL;");
  }
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error("sqlite " + path_ + ": busy_timeout: " + sqlite3_errmsg(db_));
  }
}

} // namespace depgraph::db::sqlite
