#pragma once

namespace jobhub::db {

/*
  Abstract transaction.

  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor rolls back if neither was called

  SQLite: BEGIN IMMEDIATE
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsFinished() const = 0;
};

} // namespace jobhub::db
