#pragma once

namespace liveviewer::db {

/*
  One unit of work against the viewer store.

  A page of viewers, its invitation backfill and its sign summary either
  land together or not at all. Every backend honours:

  - writes stay private until Commit()
  - Rollback() and destruction without Commit() drop every write
  - the owning thread is the only user; workers open their own
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
