#include "internal/db/api/transaction.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace depgraph::db {

namespace {

void RequireOpen(Transaction::State state, const char* operation) {
  if (state != Transaction::State::kOpen) {
    throw util::InvalidState(std::string(operation) + " on a finished transaction");
  }
}

} // namespace

void Transaction::Commit() {
  RequireOpen(state_, "commit");
  DoCommit();
  state_ = State::kCommitted;
}

void Transaction::Rollback() {
  RequireOpen(state_, "rollback");
  state_ = State::kRolledBack;
  DoRollback();
}

void Transaction::RollbackIfOpen() noexcept {
  if (state_ != State::kOpen) {
    return;
  }
  state_ = State::kRolledBack;
  try {
    DoRollback();
  } catch (const std::exception& e) {
    DEPGRAPH_LOG_WARN("transaction rollback failed", {observability::StringField("error", e.what())});
  }
}

} // namespace depgraph::db
