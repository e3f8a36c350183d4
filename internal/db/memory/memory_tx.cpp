#include "memory_tx.hpp"

#include <stdexcept>

namespace datarouter::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.writer_mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  finished_        = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  lock_.unlock();
}

} // namespace datarouter::db::memory
