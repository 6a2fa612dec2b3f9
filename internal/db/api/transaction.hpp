#pragma once

namespace relay::db {

/*
  Unit of work against the relay store.

  Every backend runs one writer at a time: Begin() blocks until the
  previous transaction finishes. Pairing redemption, command insertion
  and presence updates therefore never interleave, and a read inside a
  transaction sees exactly what the following write will change.

  An unfinished transaction rolls back when destroyed, so early returns
  and thrown relay errors leave nothing behind.

  SQLite:   BEGIN IMMEDIATE on the shared connection
  Postgres: pqxx::work on a pooled connection
  Memory:   private copy of the state, swapped in on Commit()
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;
};

} // namespace relay::db
