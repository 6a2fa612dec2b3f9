#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relay::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::mutex& serial) : serial_(serial) {
  conn_ = pool->Acquire();
  work_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (serial_.owns_lock()) {
    try {
      work_->abort();
    } catch (const std::exception& e) {
      RELAY_LOG_WARN("postgres abort failed", {relay::observability::StringField("error", e.what())});
    }
  }
  // the work must be gone before the connection goes back to the pool
  work_.reset();
}

void PgTransaction::Commit() {
  if (!serial_.owns_lock()) {
    throw util::InvalidState("postgres transaction already finished");
  }
  work_->commit();
  serial_.unlock();
}

void PgTransaction::Rollback() {
  if (!serial_.owns_lock()) return;
  work_->abort();
  serial_.unlock();
}

} // namespace relay::db::postgres
