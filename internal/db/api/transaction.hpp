#pragma once

namespace rollout::db {

/*
  One unit of work against a session store.

  Writes made through a transaction are visible to its own reads and to
  nobody else until Commit(). Rollback(), or destroying the transaction
  without committing, leaves the store as it was. A phase change is
  therefore either fully recorded or not recorded at all.

  Backends:
    sqlite  BEGIN IMMEDIATE on the shared connection
    file    staged records, each installed by atomic rename on commit
    memory  immutable snapshot plus a write set
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()            = 0;
  virtual void Rollback()          = 0;
  virtual bool IsCommitted() const = 0;
};

} // namespace rollout::db
