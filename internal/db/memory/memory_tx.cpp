#include "memory_tx.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace photosift::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::InvalidState("memory transaction already finished");
  }
  finished_ = true;
  if (!dirty_) {
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw util::InvalidState("memory transaction started at version " + std::to_string(base_version_) + " but the store is at " +
                             std::to_string(repo_.committed_version_));
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
}

// The working copy is simply dropped with the transaction.
void MemoryTransaction::Rollback() {
  finished_ = true;
}

} // namespace photosift::db::memory
