#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relay::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, std::mutex& serial) : db_(std::move(db)), serial_(serial) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!serial_.owns_lock()) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    RELAY_LOG_WARN("sqlite rollback failed", {relay::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (!serial_.owns_lock()) {
    throw util::InvalidState("sqlite transaction already finished");
  }
  db_->Exec("COMMIT;");
  serial_.unlock();
}

void SqliteTransaction::Rollback() {
  if (!serial_.owns_lock()) return;
  db_->Exec("ROLLBACK;");
  serial_.unlock();
}

} // namespace relay::db::sqlite
