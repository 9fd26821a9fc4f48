#pragma once

namespace relay::db {

/*
  Unit of work against the offset database.

  One transaction covers one settled update (ledger row + cursor move),
  one cursor write, or one prune. Either all of it lands or none of it:

  - writes stay invisible to other transactions until Commit()
  - Commit() throws util::StorageError when the backend refuses the write
    (lock timeout, I/O error, conflicting commit)
  - a transaction destroyed without Commit() rolls back

  Read-only callers simply let the transaction go out of scope.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace relay::db
