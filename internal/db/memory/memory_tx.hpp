#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace ledger::db::memory {

/*
  Transaction = exclusive lock + lazy write set.

  Reads go to the committed state until the first write, which copies
  it into a private working state. Commit swaps the working state in.
  Transactions are serialized, so never open a second one on the same
  thread while one is alive.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                      repo_;
  std::unique_lock<std::mutex>           lock_;
  std::optional<MemoryRepository::State> working_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace ledger::db::memory
