#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace depgraph::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result AppendPublication(Transaction&, const model::PublicationRecord&) override;
  std::vector<model::PublicationRecord> ListPublications(Transaction&) override;
  std::optional<model::PublicationRecord> GetPublication(Transaction&, const std::string& contract_id,
                                                         const std::string& version_label) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
