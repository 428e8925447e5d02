#pragma once

namespace depgraph::db {

/*
  One unit of work against the publication log.

  Appends stay invisible to other transactions until Commit(). A
  transaction destroyed while still open is rolled back. Commit() or
  Rollback() on a finished transaction throws InvalidState.

    memory    private copy of the log; Commit() throws if another
              transaction committed since Begin()
    sqlite    BEGIN IMMEDIATE, one open transaction per database handle
    postgres  pqxx::work on a pooled connection
*/
class Transaction {
 public:
  enum class State {
    kOpen,
    kCommitted,
    kRolledBack,
  };

  virtual ~Transaction() = default;

  void Commit();
  void Rollback();

  State state() const { return state_; }
  bool  IsOpen() const { return state_ == State::kOpen; }

 protected:
  virtual void DoCommit()   = 0;
  virtual void DoRollback() = 0;

  // For backend destructors. Failures are logged, never thrown.
  void RollbackIfOpen() noexcept;

 private:
  State state_ = State::kOpen;
};

} // namespace depgraph::db
