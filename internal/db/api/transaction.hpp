#pragma once

namespace datarouter::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - At most one write transaction is open at a time per repository
    (never Begin() twice on the same thread)

  SQLite: BEGIN IMMEDIATE under the connection's transaction lock
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot copy under the repository writer lock
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once committed or rolled back
  virtual bool IsCommitted() const = 0;
};

} // namespace datarouter::db
