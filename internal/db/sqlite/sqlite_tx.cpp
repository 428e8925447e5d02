#include "sqlite_tx.hpp"

#include "internal/util/errors.hpp"

namespace depgraph::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  // autocommit is off while another transaction holds this handle
  if (sqlite3_get_autocommit(db_->Handle()) == 0) {
    throw util::InvalidState("sqlite: a transaction is already open on this database handle");
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  RollbackIfOpen();
}

void SqliteTransaction::DoCommit() {
  db_->Exec("COMMIT;");
}

void SqliteTransaction::DoRollback() {
  // sqlite may already have rolled back on its own after an I/O error
  if (sqlite3_get_autocommit(db_->Handle()) != 0) {
    return;
  }
  db_->Exec("ROLLBACK;");
}

} // namespace depgraph::db::sqlite
