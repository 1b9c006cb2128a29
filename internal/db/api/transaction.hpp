#pragma once

namespace relay::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Never nest transactions on one thread: memory and sqlite
    Begin() blocks until the previous transaction finishes

  SQLite: BEGIN IMMEDIATE under the connection's writer lock
  Postgres: pqxx::work, item reads take row locks
  Memory: snapshot copy under the repository lock
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

}
