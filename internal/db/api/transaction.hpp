#pragma once

namespace photosift::db {

/*
  Unit of work for one stage (or one pair scan block).

  Writes stay private until Commit(); destroying an uncommitted transaction
  rolls it back, so an exception anywhere in a stage leaves the previous
  stage outputs untouched.

  Backends:
    memory  private working copy, swapped in on commit; a commit over a
            state another writer changed meanwhile throws InvalidState
    sqlite  BEGIN IMMEDIATE on the shared connection (BEGIN DEFERRED when
            opened read-only); transactions on one connection must not nest
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  // Throws util::InvalidState when already finished.
  virtual void Commit() = 0;

  // No-op when already finished.
  virtual void Rollback() = 0;
};

} // namespace photosift::db
