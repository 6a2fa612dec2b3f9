#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace relay::db::postgres {

/*
  pqxx::work on a pooled connection. Holds the repository writer lock
  until it finishes, matching the SQLite backend.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, std::mutex& serial);
  ~PgTransaction() override;

  pqxx::work& Work() { return *work_; }

  void Commit() override;
  void Rollback() override;

private:
  std::unique_lock<std::mutex>      serial_;
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
};

} // namespace relay::db::postgres
