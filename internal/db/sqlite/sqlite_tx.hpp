#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace depgraph::db::sqlite {

// Takes the write lock at BEGIN so a publish never fails halfway through
// its inserts on SQLITE_BUSY. The handle allows one open transaction.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

 private:
  void DoCommit() override;
  void DoRollback() override;

  std::shared_ptr<SqliteDB> db_;
};

} // namespace depgraph::db::sqlite
