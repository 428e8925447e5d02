#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/publication_record.hpp"

namespace depgraph::db {

/*
  Repository abstraction over the publication log.

  The log is append-only: one record per accepted publish, keyed by the
  epoch the publish produced. Replaying it in epoch order rebuilds the
  graph exactly.

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - (contract_id, version_label) and epoch are both unique
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result AppendPublication(Transaction&, const model::PublicationRecord&) = 0;

  // Ordered by epoch, references in insertion order.
  virtual std::vector<model::PublicationRecord> ListPublications(Transaction&) = 0;

  virtual std::optional<model::PublicationRecord> GetPublication(Transaction&, const std::string& contract_id,
                                                                 const std::string& version_label) = 0;
};

} // namespace depgraph::db
