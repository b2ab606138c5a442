#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace bidsub::db::memory {

// Snapshot reads with a lazily copied write set. Destroying an uncommitted
// transaction drops the write set.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);

  void Commit() override;
  void Rollback() override;

  // Throws std::logic_error once the transaction has finished.
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return writes_ ? *writes_ : *snapshot_;
  }

 private:
  MemoryRepository&                              repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       writes_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           finished_         = false;
};

} // namespace bidsub::db::memory
