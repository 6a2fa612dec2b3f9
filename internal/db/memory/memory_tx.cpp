#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace relay::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_mutex_) {
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  if (writer_.owns_lock()) Rollback();
}

void MemoryTransaction::Commit() {
  if (!writer_.owns_lock()) {
    throw util::InvalidState("memory transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  writer_.unlock();
}

void MemoryTransaction::Rollback() {
  if (writer_.owns_lock()) writer_.unlock();
}

} // namespace relay::db::memory
