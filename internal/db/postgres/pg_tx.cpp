#include "pg_tx.hpp"

namespace depgraph::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool)
    : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_, "publication_log")) {
}

PgTransaction::~PgTransaction() {
  RollbackIfOpen();
}

void PgTransaction::DoCommit() {
  work_->commit();
}

void PgTransaction::DoRollback() {
  work_->abort();
}

} // namespace depgraph::db::postgres
