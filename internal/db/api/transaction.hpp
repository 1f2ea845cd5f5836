#pragma once

namespace jobmeter::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A job row read inside a transaction stays locked against other
    writers until that transaction finishes

  SQLite: BEGIN IMMEDIATE under a connection mutex
  Postgres: pqxx::work on a pooled connection; job rows are read
            FOR UPDATE so concurrent claims of one job serialize
  Memory: snapshot copy under the repository mutex
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsCommitted() const = 0;
};

} // namespace jobmeter::db
