#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace depgraph::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result AppendPublication(Transaction&, const model::PublicationRecord&) override;
  std::vector<model::PublicationRecord> ListPublications(Transaction&) override;
  std::optional<model::PublicationRecord> GetPublication(Transaction&, const std::string& contract_id,
                                                         const std::string& version_label) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::ReferenceRecord> LoadReferences(sqlite3* db, uint64_t epoch);

  std::shared_ptr<SqliteDB> db_;
};

}
