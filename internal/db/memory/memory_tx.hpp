#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/model/publication_record.hpp"

namespace depgraph::db::memory {

class MemoryRepository;

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  std::vector<model::PublicationRecord>&       Log() { return log_; }
  const std::vector<model::PublicationRecord>& Log() const { return log_; }

 private:
  void DoCommit() override;
  void DoRollback() override;

  MemoryRepository&                     repo_;
  std::vector<model::PublicationRecord> log_;
  std::uint64_t                         base_generation_ = 0;
};

} // namespace depgraph::db::memory
