#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace depgraph::db::postgres {

// Holds one pooled connection until destroyed. The connection goes back to
// the pool only after the work has ended.
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() { return *work_; }

 private:
  void DoCommit() override;
  void DoRollback() override;

  // declared first so the work ends before the connection is released
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
};

} // namespace depgraph::db::postgres
