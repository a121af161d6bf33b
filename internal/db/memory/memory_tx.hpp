#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace photosift::db::memory {

/*
  Works on a private copy of the repository state.

  Only a transaction that asked for Mutable() publishes anything. Such a
  commit fails with InvalidState when another writer committed after the
  copy was taken; a read-only transaction never conflicts.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;

  MemoryRepository::State& Mutable() {
    dirty_ = true;
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::uint64_t           base_version_ = 0;
  bool                    dirty_        = false;
  bool                    finished_     = false;
};

} // namespace photosift::db::memory
