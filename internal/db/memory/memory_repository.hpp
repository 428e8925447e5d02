#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace depgraph::db::memory {

class MemoryTransaction;

// Process-local publication log. Nothing survives a restart.
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository() = default;

  std::unique_ptr<Transaction> Begin() override;

  Result                                  AppendPublication(Transaction&, const model::PublicationRecord&) override;
  std::vector<model::PublicationRecord>   ListPublications(Transaction&) override;
  std::optional<model::PublicationRecord> GetPublication(Transaction&, const std::string& contract_id, const std::string& version_label) override;

 private:
  friend class MemoryTransaction;

  std::mutex mutex_;
  // append order is epoch order
  std::vector<model::PublicationRecord> log_;
  // bumped by every commit, used to detect lost races
  std::uint64_t generation_ = 0;
};

} // namespace depgraph::db::memory
