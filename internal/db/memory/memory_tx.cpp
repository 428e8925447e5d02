#include "memory_tx.hpp"

#include <mutex>

#include "internal/util/errors.hpp"
#include "memory_repository.hpp"

namespace depgraph::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  log_             = repo_.log_;
  base_generation_ = repo_.generation_;
}

MemoryTransaction::~MemoryTransaction() {
  RollbackIfOpen();
}

void MemoryTransaction::DoCommit() {
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.generation_ != base_generation_) {
    throw util::InvalidState("publication log changed since the transaction began");
  }
  repo_.log_ = std::move(log_);
  ++repo_.generation_;
}

void MemoryTransaction::DoRollback() {
  log_.clear();
}

} // namespace depgraph::db::memory
