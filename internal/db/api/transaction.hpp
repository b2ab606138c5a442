#pragma once

namespace bidsub::db {

/*
  Unit of work against the job store.

  A job transition is written as one transaction: the job row update, or
  one audit append. Backends guarantee:

  - nothing is visible to other transactions before Commit()
  - Commit() throws when the write cannot be made durable
  - a transaction destroyed without Commit() is rolled back

  Memory backend: snapshot with optimistic version check.
  SQLite backend: BEGIN IMMEDIATE, serialized per connection.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace bidsub::db
