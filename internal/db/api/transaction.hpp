#pragma once

namespace market::db {

/*
  Unit of work against the store.

  Write transactions (Repository::Begin) hold the single writer slot:
  one sync item is processed, one settings check runs, or one batch of
  force-resync rows is queued per transaction.

  Read transactions (Repository::BeginRead) pin one consistent state.
  The snapshot builder relies on this to read every table as of the
  same instant. Writing through a read transaction throws InvalidState.

  Nothing is visible to other transactions before Commit(). Destroying
  an unfinished transaction rolls it back.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;

  virtual bool IsReadOnly() const = 0;
};

} // namespace market::db
