#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace relay::db::sqlite {

/*
  BEGIN IMMEDIATE on the shared connection: the write lock is taken up
  front, so a redeem or enqueue never fails halfway on SQLITE_BUSY.
  The repository mutex is held until Commit() or Rollback().
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, std::mutex& serial);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> serial_;
};

} // namespace relay::db::sqlite
