#pragma once

namespace foreman::db {

/*
  Abstract transaction.

  Semantics for all backends:

  - Writes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards all writes
  - Destructor rolls back if neither Commit() nor Rollback() ran

  SQLite: BEGIN IMMEDIATE, one writer at a time
  Postgres: pqxx::work
  Memory: snapshot copy, version-checked on commit
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace foreman::db
