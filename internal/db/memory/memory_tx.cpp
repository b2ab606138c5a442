#include "memory_tx.hpp"

#include <stdexcept>

namespace bidsub::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.version_;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (finished_) {
    throw std::logic_error("write after transaction finished");
  }
  if (!writes_) {
    writes_ = std::make_unique<MemoryRepository::State>(*snapshot_);
  }
  return *writes_;
}

void MemoryTransaction::Commit() {
  finished_ = true;
  if (!writes_) return;

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.version_ != snapshot_version_) {
    writes_.reset();
    throw std::runtime_error("transaction conflict: job store changed since snapshot");
  }
  repo_.committed_ = std::shared_ptr<const MemoryRepository::State>(std::move(writes_));
  ++repo_.version_;
}

void MemoryTransaction::Rollback() {
  finished_ = true;
  writes_.reset();
}

} // namespace bidsub::db::memory
